#include <catch2/catch.hpp>

#include "maze.hpp"

#include <queue>
#include <random>
#include <stdexcept>

namespace {

struct GraphStats {
  int passages = 0;
  int edges = 0;
  int reachable = 0;
};

// Passage cells as nodes, orthogonal passage neighbours as edges.
GraphStats analyse(const Maze& maze) {
  GraphStats s;
  for (int y = 0; y < maze.height; y++) {
    for (int x = 0; x < maze.width; x++) {
      if (!maze.is_passage(x, y))
        continue;
      s.passages++;
      if (maze.is_passage(x + 1, y))
        s.edges++;
      if (maze.is_passage(x, y + 1))
        s.edges++;
    }
  }

  std::vector<std::vector<bool>> seen(maze.height, std::vector<bool>(maze.width, false));
  std::queue<std::pair<int, int>> q;
  q.push({1, 1});
  seen[1][1] = true;
  const int dx[] = {1, -1, 0, 0};
  const int dy[] = {0, 0, 1, -1};
  while (!q.empty()) {
    auto [x, y] = q.front();
    q.pop();
    s.reachable++;
    for (int i = 0; i < 4; i++) {
      int nx = x + dx[i];
      int ny = y + dy[i];
      if (maze.is_passage(nx, ny) && !seen[ny][nx]) {
        seen[ny][nx] = true;
        q.push({nx, ny});
      }
    }
  }
  return s;
}

} // namespace

TEST_CASE("Generated maze is a spanning tree over its passages", "[maze]") {
  auto size = GENERATE(std::make_pair(11, 11), std::make_pair(31, 21), std::make_pair(71, 41), std::make_pair(101, 61), std::make_pair(13, 41));
  std::mt19937 rng(1234);
  Maze maze = generate_maze(size.first, size.second, rng);

  REQUIRE(maze.width == size.first);
  REQUIRE(maze.height == size.second);
  REQUIRE(maze.grid.size() == static_cast<size_t>(size.second));
  REQUIRE(maze.grid[0].size() == static_cast<size_t>(size.first));

  GraphStats s = analyse(maze);
  REQUIRE(s.reachable == s.passages);
  REQUIRE(s.edges == s.passages - 1);
}

TEST_CASE("Every lattice cell is carved", "[maze]") {
  std::mt19937 rng(99);
  Maze maze = generate_maze(31, 21, rng);
  for (int y = 1; y < maze.height; y += 2) {
    for (int x = 1; x < maze.width; x += 2)
      REQUIRE(maze.is_passage(x, y));
  }
}

TEST_CASE("Border is solid wall", "[maze]") {
  std::mt19937 rng(7);
  Maze maze = generate_maze(31, 21, rng);
  for (int x = 0; x < maze.width; x++) {
    REQUIRE(maze.grid[0][x] == Cell::WALL);
    REQUIRE(maze.grid[maze.height - 1][x] == Cell::WALL);
  }
  for (int y = 0; y < maze.height; y++) {
    REQUIRE(maze.grid[y][0] == Cell::WALL);
    REQUIRE(maze.grid[y][maze.width - 1] == Cell::WALL);
  }
}

TEST_CASE("Start and goal are odd passage cells", "[maze]") {
  Maze maze = generate_maze(71, 41);
  REQUIRE(maze.is_passage(1, 1));
  REQUIRE(maze.goal_x == 69);
  REQUIRE(maze.goal_y == 39);
  REQUIRE(maze.goal_x % 2 == 1);
  REQUIRE(maze.goal_y % 2 == 1);
  REQUIRE(maze.is_passage(maze.goal_x, maze.goal_y));
}

TEST_CASE("Same seed gives the same maze", "[maze]") {
  std::mt19937 a(42);
  std::mt19937 b(42);
  std::mt19937 c(43);
  Maze first = generate_maze(31, 21, a);
  Maze second = generate_maze(31, 21, b);
  Maze third = generate_maze(31, 21, c);
  REQUIRE(first.grid == second.grid);
  REQUIRE(first.grid != third.grid);
}

TEST_CASE("Invalid sizes are rejected", "[maze]") {
  std::mt19937 rng(1);
  REQUIRE_THROWS_AS(generate_maze(9, 21, rng), std::invalid_argument);
  REQUIRE_THROWS_AS(generate_maze(31, 20, rng), std::invalid_argument);
  REQUIRE_THROWS_AS(generate_maze(0, 0, rng), std::invalid_argument);
  REQUIRE_FALSE(valid_maze_size(12, 11));
  REQUIRE(valid_maze_size(11, 11));
}

TEST_CASE("Large mazes don't exhaust the stack", "[maze]") {
  std::mt19937 rng(5);
  Maze maze = generate_maze(401, 401, rng);
  GraphStats s = analyse(maze);
  REQUIRE(s.edges == s.passages - 1);
}
