#include "session.hpp"
#include "logger.hpp"
#include "protocol.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>

Session::Session(ConnectionId id, std::shared_ptr<Connection> connection, GameState& state, Broadcaster& broadcaster)
    : id(id), connection(std::move(connection)), state(state), broadcaster(broadcaster) {}

void Session::open() {
  state.add_player(id, connection);
  session_state = SessionState::ACTIVE;
  Logger::log(Logger::INFO, Logger::with_peer(connection->peer(), "", "New connection"));
  broadcaster.broadcast();
}

void Session::close() {
  state.remove_player(id);
  connection->close();
  session_state = SessionState::CLOSED;
  broadcaster.broadcast();
}

void Session::run() {
  auto started = std::chrono::steady_clock::now();
  open();

  std::string text;
  std::string error;
  while (session_state == SessionState::ACTIVE) {
    ReadStatus status = connection->read_text(text, error);
    if (status == ReadStatus::END_OF_STREAM)
      break;
    if (status != ReadStatus::OK) {
      Logger::log(Logger::WARN, Logger::with_peer(connection->peer(), "", "Read error: " + error));
      break;
    }

    PlayerUpdate update;
    if (!decode_player_update(text, update, error)) {
      Logger::log(Logger::WARN, Logger::with_peer(connection->peer(), "", "Decode error: " + error));
      break;
    }
    Logger::log(Logger::DEBUG, Logger::with_peer(connection->peer(), update.name, "update x=" + std::to_string(update.x) + " y=" + std::to_string(update.y)));
    state.apply_update(id, update);
    broadcaster.broadcast();
  }

  std::string name;
  if (auto p = state.player(id))
    name = p->name;
  close();

  std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
  std::ostringstream oss;
  oss << "Connection closed (duration: " << std::fixed << std::setprecision(3) << elapsed.count() << "s): " << connection->peer() << " [" << name << "]";
  Logger::log(Logger::INFO, oss.str());
}
