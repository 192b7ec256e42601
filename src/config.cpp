#include "config.hpp"
#include "logger.hpp"
#include "maze.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>

static bool parse_int(const std::string& s, int& out) {
  if (s.empty())
    return false;
  char* end = nullptr;
  errno = 0;
  long v = std::strtol(s.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || v < -100000 || v > 100000)
    return false;
  out = static_cast<int>(v);
  return true;
}

void coerce_maze_size(int& width, int& height) {
  if (width < MAZE_MIN_SIDE || height < MAZE_MIN_SIDE) {
    Logger::log(Logger::WARN, "Maze size " + std::to_string(width) + "x" + std::to_string(height) + " too small, using " + std::to_string(DEFAULT_MAZE_WIDTH) + "x" +
                                  std::to_string(DEFAULT_MAZE_HEIGHT));
    width = DEFAULT_MAZE_WIDTH;
    height = DEFAULT_MAZE_HEIGHT;
    return;
  }
  if (width % 2 == 0)
    width++;
  if (height % 2 == 0)
    height++;
}

uint16_t parse_port(const std::string& value) {
  int port = 0;
  if (!parse_int(value, port) || port <= 0 || port > 65535) {
    Logger::log(Logger::WARN, "Invalid port '" + value + "', using " + std::to_string(DEFAULT_PORT));
    return DEFAULT_PORT;
  }
  return static_cast<uint16_t>(port);
}

// Named presets; false if `name` is unknown.
static bool apply_preset(const std::string& name, ServerConfig& cfg) {
  if (name == "small") {
    cfg.maze_width = 31;
    cfg.maze_height = 21;
  } else if (name == "medium") {
    cfg.maze_width = 71;
    cfg.maze_height = 41;
  } else if (name == "large") {
    cfg.maze_width = 101;
    cfg.maze_height = 61;
  } else if (name == "huge") {
    cfg.maze_width = 151;
    cfg.maze_height = 81;
  } else {
    return false;
  }
  return true;
}

ServerConfig parse_config(int argc, char* argv[]) {
  ServerConfig cfg;
  if (const char* env = std::getenv("MAZE_PORT"))
    cfg.port = parse_port(env);
  if (const char* env = std::getenv("LOG_FILE"))
    cfg.log_file = env;

  int width = 0;
  int height = 0;
  bool custom = false;

  for (int i = 1; i < argc; i++) {
    const char* arg = argv[i];

    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      cfg.help = true;
    } else if (std::strcmp(arg, "--port") == 0 && i + 1 < argc) {
      cfg.port = parse_port(argv[++i]);
    } else if (std::strcmp(arg, "--size") == 0 && i + 1 < argc) {
      std::string preset = argv[++i];
      if (!apply_preset(preset, cfg)) {
        Logger::log(Logger::WARN, "Unknown maze size '" + preset + "', using medium");
        apply_preset("medium", cfg);
      }
    } else if (std::strcmp(arg, "--width") == 0 && i + 1 < argc) {
      custom = true;
      if (!parse_int(argv[++i], width))
        width = 0;
    } else if (std::strcmp(arg, "--height") == 0 && i + 1 < argc) {
      custom = true;
      if (!parse_int(argv[++i], height))
        height = 0;
    } else if (std::strcmp(arg, "--log-file") == 0 && i + 1 < argc) {
      cfg.log_file = argv[++i];
    } else {
      Logger::log(Logger::WARN, std::string("Unknown argument: ") + arg);
    }
  }

  if (custom) {
    coerce_maze_size(width, height);
    cfg.maze_width = width;
    cfg.maze_height = height;
  }
  return cfg;
}

void print_usage(const char* progname) {
  std::cout << "Usage: " << progname << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --port <port>         Listen port (default: 8080, env MAZE_PORT)\n";
  std::cout << "  --size <preset>       small (31x21), medium (71x41), large (101x61), huge (151x81)\n";
  std::cout << "  --width <n>           Custom maze width (odd, >= 11)\n";
  std::cout << "  --height <n>          Custom maze height (odd, >= 11)\n";
  std::cout << "  --log-file <path>     Also append logs to a file, \"\" to disable (env LOG_FILE, default " DEFAULT_LOG_FILE ")\n";
  std::cout << "  --help                Show this help message\n";
  std::cout << "\nLog level is taken from LOG_LEVEL (DEBUG, INFO, WARN, ERROR).\n";
}
