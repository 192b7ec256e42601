// Maze race server entry point.
#include "config.hpp"
#include "game_state.hpp"
#include "logger.hpp"
#include "server.hpp"
#include <chrono>
#include <csignal>
#include <stdexcept>
#include <thread>

namespace {
volatile std::sig_atomic_t g_running = 1;

void signal_handler(int sig) {
  (void)sig;
  g_running = 0;
}
} // namespace

int main(int argc, char* argv[]) {
  ServerConfig cfg = parse_config(argc, argv);
  if (cfg.help) {
    print_usage(argv[0]);
    return 0;
  }
  if (!cfg.log_file.empty() && !Logger::set_file(cfg.log_file))
    Logger::log(Logger::WARN, "Failed to open log file " + cfg.log_file + ", logging to stdout only");

  Logger::log(Logger::INFO, "=== Starting Maze Runner Server Session ===");
  Logger::log(Logger::INFO, "Selected maze size: " + std::to_string(cfg.maze_width) + "x" + std::to_string(cfg.maze_height));

  try {
    GameState state(cfg.maze_width, cfg.maze_height);
    Server server(state, cfg.port);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    server.start();
    Logger::log(Logger::INFO, "Press Ctrl+C to stop");

    while (g_running && server.is_running())
      std::this_thread::sleep_for(std::chrono::milliseconds(100));

    server.stop();
  } catch (const std::exception& e) {
    Logger::log(Logger::ERROR, std::string("Server failed: ") + e.what());
    return 1;
  }
  return 0;
}
