// GameState: the single owner of all shared round state.
//
// Holds the maze, the player registry, the finish-rank counter, the sticky
// game-over flag, the round start time and the snapshot sequence behind one
// mutex. Every public method takes the lock for its whole duration and never
// performs socket I/O while holding it; callers get copies.
//
// Round phases:
// ACTIVE: players racing
// OVER:   registry non-empty and everyone finished; sticky until `reset()`
#pragma once
#include "maze.hpp"
#include "player.hpp"
#include <ctime>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <vector>

enum class RoundPhase { ACTIVE, OVER };

struct MazeInfo {
  int goal_x;
  int goal_y;
  int width;
  int height;
};

// Point-in-time copy taken under the lock.
struct Snapshot {
  uint64_t sequence = 0;
  bool all_finished = false;
  bool game_over = false;
  std::vector<Player> players;
  std::vector<std::shared_ptr<Connection>> recipients;
};

class GameState {
public:
  // Wall-clock seconds; replaceable in tests.
  using Clock = std::function<std::time_t()>;

private:
  mutable std::mutex mutex;
  Maze maze;
  PlayerRegistry registry;
  int finish_rank = 0;
  bool game_over = false;
  std::time_t start_time = 0;
  uint64_t sequence = 0;
  Clock clock;
  std::mt19937 rng;

  // Flip to OVER the first time everyone is finished. Lock must be held.
  void check_round_over();

public:
  // Generates the first maze and starts the first round.
  // Throws std::invalid_argument on an invalid maze size.
  GameState(int width, int height, Clock clock = [] { return std::time(nullptr); });
  GameState(int width, int height, Clock clock, std::mt19937::result_type seed);

  // Register a new player at spawn for `id`.
  void add_player(ConnectionId id, std::shared_ptr<Connection> connection);
  // Unregister; no-op if absent. Returns whether a player was removed.
  bool remove_player(ConnectionId id);
  // Apply a client update and the finish transition.
  // Returns false if `id` is not registered.
  bool apply_update(ConnectionId id, const PlayerUpdate& update);
  // Copy players and recipients, evaluate game over, stamp a new sequence.
  Snapshot snapshot();
  // New round: regenerate the maze, clear finish state, restart the clock.
  void reset();

  std::vector<std::vector<int>> maze_grid() const;
  MazeInfo maze_info() const;
  Maze current_maze() const;
  RoundPhase phase() const;
  std::optional<Player> player(ConnectionId id) const;
  size_t player_count() const;
};
