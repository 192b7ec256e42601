#include "server.hpp"
#include "logger.hpp"
#include "net.hpp"
#include "protocol.hpp"
#include "session.hpp"
#include "util.hpp"
#include "websocket.hpp"
#include <cerrno>
#include <cstring>
#include <memory>
#include <netinet/in.h>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

#define JSON_CONTENT_TYPE "application/json"

Server::Server(GameState& state, uint16_t port) : listen_port(port), state(state), broadcaster(state) {
  server_socket = check(socket(AF_INET, SOCK_STREAM, 0), "socket");

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(listen_port);
  addr.sin_addr.s_addr = INADDR_ANY;

  try {
    int opt = 1;
    check(setsockopt(server_socket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)), "setsockopt");
    check(bind(server_socket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), "bind");
    check(listen(server_socket, SOMAXCONN), "listen");

    socklen_t len = sizeof(addr);
    check(getsockname(server_socket, reinterpret_cast<sockaddr*>(&addr), &len), "getsockname");
    listen_port = ntohs(addr.sin_port);
  } catch (const std::runtime_error&) {
    close(server_socket);
    throw;
  }
}

void Server::start() {
  if (running.exchange(true))
    return;
  accept_thread = std::thread(&Server::accept_loop, this);
  Logger::log(Logger::INFO, "Listening on port " + std::to_string(listen_port));
}

void Server::accept_loop() {
  while (running) {
    int cli = accept(server_socket, nullptr, nullptr);
    if (cli < 0) {
      if (errno == EINTR)
        continue;
      if (running)
        Logger::log(Logger::ERROR, std::string("accept: ") + std::strerror(errno));
      break;
    }
    {
      std::lock_guard<std::mutex> lock(workers_mutex);
      if (!running) {
        close(cli);
        break;
      }
      workers++;
      open_fds.insert(cli);
    }
    try {
      std::thread(&Server::handle_client, this, cli).detach();
    } catch (const std::system_error& e) {
      Logger::log(Logger::ERROR, std::string("worker thread: ") + e.what());
      release_fd(cli);
      close(cli);
      std::lock_guard<std::mutex> lock(workers_mutex);
      workers--;
      workers_done.notify_all();
    }
  }
}

void Server::release_fd(int fd) {
  std::lock_guard<std::mutex> lock(workers_mutex);
  open_fds.erase(fd);
}

void Server::handle_client(int fd) {
  bool owned = true;
  std::string peer = net::peer_address(fd);
  try {
    net::set_read_timeout(fd, REQUEST_TIMEOUT_SECONDS);
    HttpRequest request;
    if (read_request(fd, request)) {
      Logger::log(Logger::DEBUG, Logger::with_peer(peer, "", request.method + " " + request.path));
      if (request.path == "/ws" && request.is_websocket_upgrade()) {
        owned = false;
        serve_websocket(fd, request);
      } else {
        route(fd, request);
      }
    } else {
      Logger::log(Logger::DEBUG, Logger::with_peer(peer, "", "bad or incomplete request"));
      if (!send_response(fd, 400, JSON_CONTENT_TYPE, encode_error("bad request")))
        Logger::log(Logger::DEBUG, "400 response not delivered");
    }
  } catch (const std::exception& e) {
    Logger::log(Logger::ERROR, Logger::with_peer(peer, "", std::string("worker failed: ") + e.what()));
  }

  if (owned) {
    release_fd(fd);
    close(fd);
  }

  std::lock_guard<std::mutex> lock(workers_mutex);
  workers--;
  workers_done.notify_all();
}

void Server::route(int fd, const HttpRequest& request) {
  int status = 200;
  std::string body;

  if (request.method == "OPTIONS") {
    status = 204;
  } else if (request.path == "/maze" || request.path == "/info") {
    if (request.method != "GET") {
      status = 405;
      body = encode_error("method not allowed");
    } else if (request.path == "/maze") {
      body = encode_maze(state.maze_grid());
    } else {
      body = encode_maze_info(state.maze_info());
    }
  } else if (request.path == "/reset") {
    if (request.method != "GET" && request.method != "POST") {
      status = 405;
      body = encode_error("method not allowed");
    } else {
      Logger::log(Logger::INFO, "Game reset requested via API");
      state.reset();
      broadcaster.broadcast();
      body = encode_ack();
    }
  } else if (request.path == "/ws") {
    status = 400;
    body = encode_error("websocket upgrade required");
  } else {
    status = 404;
    body = encode_error("not found");
  }

  if (!send_response(fd, status, body.empty() ? "" : JSON_CONTENT_TYPE, body))
    Logger::log(Logger::DEBUG, Logger::with_peer(net::peer_address(fd), "", "response not delivered"));
}

void Server::serve_websocket(int fd, const HttpRequest& request) {
  std::string peer = net::peer_address(fd);
  // The connection owns `fd` from here on. It is released from `open_fds`
  // before `connection` can close it.
  auto connection = std::make_shared<WebSocketConnection>(fd, peer);
  try {
    if (!ws::send_handshake(fd, request)) {
      Logger::log(Logger::WARN, Logger::with_peer(peer, "", "handshake failed"));
      release_fd(fd);
      return;
    }
    net::set_read_timeout(fd, 0);

    Session session(next_id++, connection, state, broadcaster);
    session.run();
  } catch (const std::exception&) {
    release_fd(fd);
    throw;
  }
  release_fd(fd);
}

void Server::stop() {
  if (!running.exchange(false))
    return;
  Logger::log(Logger::INFO, "Shutting down...");
  shutdown(server_socket, SHUT_RDWR);
  if (accept_thread.joinable())
    accept_thread.join();

  std::unique_lock<std::mutex> lock(workers_mutex);
  for (int fd : open_fds)
    shutdown(fd, SHUT_RDWR);
  workers_done.wait(lock, [this] { return workers == 0; });
  Logger::log(Logger::INFO, "Server stopped");
}

Server::~Server() {
  stop();
  close(server_socket);
}
