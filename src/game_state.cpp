#include "game_state.hpp"
#include "logger.hpp"
#include <chrono>

GameState::GameState(int width, int height, Clock clock)
    : GameState(width, height, std::move(clock), static_cast<std::mt19937::result_type>(std::chrono::high_resolution_clock::now().time_since_epoch().count())) {}

GameState::GameState(int width, int height, Clock clock, std::mt19937::result_type seed) : clock(std::move(clock)), rng(seed) {
  maze = generate_maze(width, height, rng);
  start_time = this->clock();
}

void GameState::check_round_over() {
  if (!game_over && registry.all_finished()) {
    game_over = true;
    Logger::log(Logger::INFO, "GAME OVER: All players have reached the goal!");
  }
}

void GameState::add_player(ConnectionId id, std::shared_ptr<Connection> connection) {
  std::lock_guard<std::mutex> lock(mutex);
  registry.add(id, std::move(connection));
}

bool GameState::remove_player(ConnectionId id) {
  std::lock_guard<std::mutex> lock(mutex);
  bool removed = registry.remove(id);
  if (removed)
    check_round_over();
  return removed;
}

bool GameState::apply_update(ConnectionId id, const PlayerUpdate& update) {
  std::lock_guard<std::mutex> lock(mutex);
  Player* p = registry.find(id);
  if (!p)
    return false;
  bool was_finished = p->finished;
  registry.update(id, update);
  if (update.finished && !was_finished) {
    p->finished = true;
    p->finish_rank = ++finish_rank;
    p->finish_time = static_cast<int64_t>(clock() - start_time);
    Logger::log(Logger::INFO, "PLAYER FINISHED! Name: " + p->name + " | Rank: " + std::to_string(p->finish_rank) + " | Time: " + std::to_string(p->finish_time) + "s");
  }
  check_round_over();
  return true;
}

Snapshot GameState::snapshot() {
  std::lock_guard<std::mutex> lock(mutex);
  check_round_over();
  Snapshot s;
  s.sequence = ++sequence;
  s.all_finished = registry.all_finished();
  s.game_over = game_over;
  s.players = registry.players();
  s.recipients = registry.connections();
  return s;
}

void GameState::reset() {
  std::lock_guard<std::mutex> lock(mutex);
  Logger::log(Logger::INFO, "Game reset requested");
  maze = generate_maze(maze.width, maze.height, rng);
  registry.reset_all();
  finish_rank = 0;
  game_over = false;
  start_time = clock();
}

std::vector<std::vector<int>> GameState::maze_grid() const {
  std::lock_guard<std::mutex> lock(mutex);
  std::vector<std::vector<int>> out(maze.height, std::vector<int>(maze.width));
  for (int y = 0; y < maze.height; y++) {
    for (int x = 0; x < maze.width; x++)
      out[y][x] = static_cast<int>(maze.grid[y][x]);
  }
  return out;
}

MazeInfo GameState::maze_info() const {
  std::lock_guard<std::mutex> lock(mutex);
  return MazeInfo{maze.goal_x, maze.goal_y, maze.width, maze.height};
}

Maze GameState::current_maze() const {
  std::lock_guard<std::mutex> lock(mutex);
  return maze;
}

RoundPhase GameState::phase() const {
  std::lock_guard<std::mutex> lock(mutex);
  return game_over ? RoundPhase::OVER : RoundPhase::ACTIVE;
}

std::optional<Player> GameState::player(ConnectionId id) const {
  std::lock_guard<std::mutex> lock(mutex);
  const Player* p = registry.find(id);
  if (!p)
    return std::nullopt;
  return *p;
}

size_t GameState::player_count() const {
  std::lock_guard<std::mutex> lock(mutex);
  return registry.size();
}
