#pragma once
// Config: server settings from the command line and environment.
//
// Precedence: command line, then environment (MAZE_PORT, LOG_FILE), then
// defaults. Invalid values never fail startup; they fall back to defaults.
#include <cstdint>
#include <string>

#define DEFAULT_PORT 8080
#define DEFAULT_MAZE_WIDTH 71
#define DEFAULT_MAZE_HEIGHT 41
#define DEFAULT_LOG_FILE "server.log"

struct ServerConfig {
  uint16_t port = DEFAULT_PORT;
  int maze_width = DEFAULT_MAZE_WIDTH;
  int maze_height = DEFAULT_MAZE_HEIGHT;
  // Empty disables the file tee.
  std::string log_file = DEFAULT_LOG_FILE;
  bool help = false;
};

// Coerce a requested maze size: below the minimum falls back to the default
// size, even sides are bumped to the next odd value.
void coerce_maze_size(int& width, int& height);

// Parse a port; 0, out of range or non-numeric falls back to DEFAULT_PORT.
uint16_t parse_port(const std::string& value);

ServerConfig parse_config(int argc, char* argv[]);

void print_usage(const char* progname);
