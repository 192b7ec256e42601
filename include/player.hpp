// Player records and the registry that owns them.
//
// The registry maps a connection id to its player and the connection used to
// reach it. It does no locking of its own: it is only touched by GameState
// while GameState's lock is held.
#pragma once
#include "connection.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

using ConnectionId = uint64_t;

#define SPAWN_X 1
#define SPAWN_Y 1
#define DEFAULT_PLAYER_NAME "Anon"
#define DEFAULT_PLAYER_COLOR "#ff0000"

struct Player {
  int x = SPAWN_X;
  int y = SPAWN_Y;
  std::string name = DEFAULT_PLAYER_NAME;
  std::string color = DEFAULT_PLAYER_COLOR;
  bool finished = false;
  int finish_rank = 0;  // 0 = unranked
  int64_t finish_time = 0; // seconds since round start
};

// Client-reported state. Position and finished flag are trusted as-is.
struct PlayerUpdate {
  int x = 0;
  int y = 0;
  std::string name;
  std::string color;
  bool finished = false;
};

class PlayerRegistry {
  struct Entry {
    Player player;
    std::shared_ptr<Connection> connection;
  };
  std::map<ConnectionId, Entry> entries;

public:
  // Insert a fresh player at spawn. Replaces any record under the same id.
  Player& add(ConnectionId id, std::shared_ptr<Connection> connection);
  // Remove a player. Returns false if `id` was not registered.
  bool remove(ConnectionId id);
  // nullptr if absent.
  Player* find(ConnectionId id);
  const Player* find(ConnectionId id) const;
  // Overwrite position, name and color. Returns false if `id` is unknown.
  // Finish handling is GameState's job.
  bool update(ConnectionId id, const PlayerUpdate& u);

  std::vector<Player> players() const;
  std::vector<std::shared_ptr<Connection>> connections() const;
  size_t size() const {
    return entries.size();
  }
  bool empty() const {
    return entries.empty();
  }
  // True when non-empty and every player is finished.
  bool all_finished() const;
  // Send everyone back to spawn with finish state cleared.
  void reset_all();
};
