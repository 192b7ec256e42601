// Maze generation
//
// Overview:
// - A maze is a `height x width` grid of cells, 0 = passage, 1 = wall
// - Only cells with both coordinates odd are carved as lattice cells; the
//   cell between two neighbouring lattice cells is knocked down when the
//   carve moves between them
// - The carve is a randomized depth-first walk from (1,1), so the passages
//   form a spanning tree over the lattice (a perfect maze)
// - The goal is (width-2, height-2) pulled back to odd parity and always
//   carved
#pragma once
#include <cstdint>
#include <random>
#include <vector>

// Smallest accepted side length. Anything below is rejected by `generate_maze`.
#define MAZE_MIN_SIDE 11

enum class Cell : uint8_t { PASSAGE = 0, WALL = 1 };

struct Maze {
  int width = 0;
  int height = 0;
  int goal_x = 0;
  int goal_y = 0;
  // Row-major: grid[y][x].
  std::vector<std::vector<Cell>> grid;

  bool in_bounds(int x, int y) const {
    return x >= 0 && y >= 0 && x < width && y < height;
  }
  bool is_passage(int x, int y) const {
    return in_bounds(x, y) && grid[y][x] == Cell::PASSAGE;
  }
};

// True when both sides are odd and at least MAZE_MIN_SIDE.
bool valid_maze_size(int width, int height);

// Carve a new maze using `rng` for the neighbour shuffles.
// Throws std::invalid_argument when `valid_maze_size` fails.
Maze generate_maze(int width, int height, std::mt19937& rng);

// Same as above with an engine seeded from the current time.
Maze generate_maze(int width, int height);
