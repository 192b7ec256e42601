#pragma once
// Session: lifetime of one live-state connection.
//
// CONNECTING: upgraded transport, player not yet registered
// ACTIVE:     player registered; each inbound message is applied and
//             broadcast
// CLOSED:     player unregistered, transport closed, departure broadcast
#include "broadcaster.hpp"
#include "connection.hpp"
#include "game_state.hpp"
#include <memory>

enum class SessionState { CONNECTING, ACTIVE, CLOSED };

class Session {
  ConnectionId id;
  std::shared_ptr<Connection> connection;
  GameState& state;
  Broadcaster& broadcaster;
  SessionState session_state = SessionState::CONNECTING;

  void open();
  void close();

public:
  Session(ConnectionId id, std::shared_ptr<Connection> connection, GameState& state, Broadcaster& broadcaster);
  // Run until the client goes away or sends something undecodable.
  void run();
  SessionState current_state() const {
    return session_state;
  }
};
