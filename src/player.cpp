#include "player.hpp"
#include <algorithm>

Player& PlayerRegistry::add(ConnectionId id, std::shared_ptr<Connection> connection) {
  Entry& e = entries[id];
  e.player = Player{};
  e.connection = std::move(connection);
  return e.player;
}

bool PlayerRegistry::remove(ConnectionId id) {
  return entries.erase(id) > 0;
}

Player* PlayerRegistry::find(ConnectionId id) {
  auto it = entries.find(id);
  return it == entries.end() ? nullptr : &it->second.player;
}

const Player* PlayerRegistry::find(ConnectionId id) const {
  auto it = entries.find(id);
  return it == entries.end() ? nullptr : &it->second.player;
}

bool PlayerRegistry::update(ConnectionId id, const PlayerUpdate& u) {
  Player* p = find(id);
  if (!p)
    return false;
  p->x = u.x;
  p->y = u.y;
  p->name = u.name;
  p->color = u.color;
  return true;
}

std::vector<Player> PlayerRegistry::players() const {
  std::vector<Player> out;
  out.reserve(entries.size());
  for (const auto& kv : entries)
    out.push_back(kv.second.player);
  return out;
}

std::vector<std::shared_ptr<Connection>> PlayerRegistry::connections() const {
  std::vector<std::shared_ptr<Connection>> out;
  out.reserve(entries.size());
  for (const auto& kv : entries) {
    if (kv.second.connection)
      out.push_back(kv.second.connection);
  }
  return out;
}

bool PlayerRegistry::all_finished() const {
  return !entries.empty() && std::all_of(entries.begin(), entries.end(), [](const std::pair<const ConnectionId, Entry>& kv) { return kv.second.player.finished; });
}

void PlayerRegistry::reset_all() {
  for (auto& kv : entries) {
    Player& p = kv.second.player;
    p.x = SPAWN_X;
    p.y = SPAWN_Y;
    p.finished = false;
    p.finish_rank = 0;
    p.finish_time = 0;
  }
}
