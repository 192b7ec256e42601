#include "maze.hpp"
#include "logger.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <stdexcept>
#include <string>

namespace {
struct Step {
  int dx;
  int dy;
};

// One lattice cell on the carve stack with its shuffled directions and the
// index of the next direction to try.
struct Frame {
  int x;
  int y;
  std::array<Step, 4> dirs;
  size_t next;
};

Frame enter(std::vector<std::vector<Cell>>& grid, int x, int y, std::mt19937& rng) {
  grid[y][x] = Cell::PASSAGE;
  Frame f{x, y, {{{0, 2}, {0, -2}, {2, 0}, {-2, 0}}}, 0};
  std::shuffle(f.dirs.begin(), f.dirs.end(), rng);
  return f;
}
} // namespace

bool valid_maze_size(int width, int height) {
  return width >= MAZE_MIN_SIDE && height >= MAZE_MIN_SIDE && width % 2 == 1 && height % 2 == 1;
}

Maze generate_maze(int width, int height, std::mt19937& rng) {
  if (!valid_maze_size(width, height)) {
    throw std::invalid_argument("maze size must be odd and at least " + std::to_string(MAZE_MIN_SIDE) + ", got " + std::to_string(width) + "x" +
                                std::to_string(height));
  }
  Logger::log(Logger::INFO, "Generating maze " + std::to_string(width) + "x" + std::to_string(height) + "...");

  Maze maze;
  maze.width = width;
  maze.height = height;
  maze.grid.assign(height, std::vector<Cell>(width, Cell::WALL));

  // Explicit stack instead of recursion: depth grows with the maze area.
  std::vector<Frame> stack;
  stack.push_back(enter(maze.grid, 1, 1, rng));
  while (!stack.empty()) {
    Frame& top = stack.back();
    if (top.next == top.dirs.size()) {
      stack.pop_back();
      continue;
    }
    Step d = top.dirs[top.next++];
    int nx = top.x + d.dx;
    int ny = top.y + d.dy;
    if (nx > 0 && nx < width - 1 && ny > 0 && ny < height - 1 && maze.grid[ny][nx] == Cell::WALL) {
      maze.grid[top.y + d.dy / 2][top.x + d.dx / 2] = Cell::PASSAGE;
      // `top` is invalidated by the push below.
      stack.push_back(enter(maze.grid, nx, ny, rng));
    }
  }

  maze.goal_x = width - 2;
  maze.goal_y = height - 2;
  if (maze.goal_x % 2 == 0)
    maze.goal_x--;
  if (maze.goal_y % 2 == 0)
    maze.goal_y--;
  maze.grid[maze.goal_y][maze.goal_x] = Cell::PASSAGE;

  Logger::log(Logger::INFO, "Maze generated. Goal at (" + std::to_string(maze.goal_x) + ", " + std::to_string(maze.goal_y) + ")");
  return maze;
}

Maze generate_maze(int width, int height) {
  std::mt19937 rng(static_cast<std::mt19937::result_type>(std::chrono::high_resolution_clock::now().time_since_epoch().count()));
  return generate_maze(width, height, rng);
}
