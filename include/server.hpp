// Maze race server: accepts TCP connections and serves the game endpoints
//
// Responsibilities:
// - Accept incoming TCP connections on one port
// - Answer the read-only maze queries (/maze, /info) and the reset action
// - Upgrade /ws requests to WebSocket and run a Session for each
// - Broadcast state after every reset
//
// Concurrency:
// - One accept thread; one worker thread per accepted connection
// - All game state lives in GameState behind its own lock
// - `stop()` shuts down the listener and every open client socket, then
//   waits for all workers to finish
#pragma once
#include "broadcaster.hpp"
#include "game_state.hpp"
#include "http.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>
#include <thread>

// Seconds a client may take to send its request head.
#define REQUEST_TIMEOUT_SECONDS 10

class Server {
  int server_socket;
  uint16_t listen_port;
  GameState& state;
  Broadcaster broadcaster;
  std::atomic<bool> running{false};
  std::atomic<ConnectionId> next_id{1};
  std::thread accept_thread;

  // Worker bookkeeping for orderly shutdown.
  std::mutex workers_mutex;
  std::condition_variable workers_done;
  size_t workers = 0;
  std::set<int> open_fds;

  // Accept until the listener is shut down.
  void accept_loop();
  // Worker body: read one request and dispatch it.
  void handle_client(int fd);
  // Answer a plain HTTP request.
  void route(int fd, const HttpRequest& request);
  // Upgrade and run a session until the client leaves.
  void serve_websocket(int fd, const HttpRequest& request);
  void release_fd(int fd);

public:
  // Bind/listen on `port` (0 picks a free port).
  // Throws std::runtime_error if the socket can't be set up.
  Server(GameState& state, uint16_t port = 8080);
  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;
  // Start the accept thread.
  void start();
  // Request server shutdown and wait for every worker.
  void stop();
  bool is_running() const {
    return running;
  }
  // Port actually bound.
  uint16_t port() const {
    return listen_port;
  }
  ~Server();
};
