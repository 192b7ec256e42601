#include "protocol.hpp"
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static json player_to_json(const Player& p) {
  return json{{"x", p.x}, {"y", p.y}, {"name", p.name}, {"color", p.color}, {"finished", p.finished}, {"finishRank", p.finish_rank}, {"finishTime", p.finish_time}};
}

// Absent and null fields both mean "zero value".
static bool field_or_null(const json& j, const char* key) {
  auto it = j.find(key);
  return it == j.end() || it->is_null();
}

// Integral JSON number that fits in an int; fractions and overflow are errors.
static bool read_int(const json& j, const char* key, int& out, std::string& error) {
  if (field_or_null(j, key)) {
    out = 0;
    return true;
  }
  const json& v = j[key];
  if (!v.is_number_integer()) {
    error = std::string("field '") + key + "' must be an integer";
    return false;
  }
  if (v.is_number_unsigned()) {
    uint64_t u = v.get<uint64_t>();
    if (u > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
      error = std::string("field '") + key + "' out of range";
      return false;
    }
    out = static_cast<int>(u);
    return true;
  }
  int64_t n = v.get<int64_t>();
  if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
    error = std::string("field '") + key + "' out of range";
    return false;
  }
  out = static_cast<int>(n);
  return true;
}

bool decode_player_update(const std::string& text, PlayerUpdate& out, std::string& error) {
  if (text.size() > MAX_PAYLOAD_SIZE) {
    error = "payload too large";
    return false;
  }
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded()) {
    error = "invalid JSON";
    return false;
  }
  if (!j.is_object()) {
    error = "expected a JSON object";
    return false;
  }
  PlayerUpdate u;
  if (!read_int(j, "x", u.x, error) || !read_int(j, "y", u.y, error))
    return false;
  try {
    u.name = field_or_null(j, "name") ? std::string() : j.at("name").get<std::string>();
    u.color = field_or_null(j, "color") ? std::string() : j.at("color").get<std::string>();
    u.finished = field_or_null(j, "finished") ? false : j.at("finished").get<bool>();
  } catch (const json::exception& e) {
    error = e.what();
    return false;
  }
  out = std::move(u);
  return true;
}

std::string encode_state(const Snapshot& snapshot) {
  json players = json::array();
  for (const auto& p : snapshot.players)
    players.push_back(player_to_json(p));
  json j{{"allFinished", snapshot.all_finished}, {"players", std::move(players)}, {"gameOver", snapshot.game_over}};
  return j.dump();
}

std::string encode_maze(const std::vector<std::vector<int>>& grid) {
  return json(grid).dump();
}

std::string encode_maze_info(const MazeInfo& info) {
  json j{{"goalX", info.goal_x}, {"goalY", info.goal_y}, {"width", info.width}, {"height", info.height}};
  return j.dump();
}

std::string encode_ack() {
  return json{{"ok", true}}.dump();
}

std::string encode_error(const std::string& message) {
  return json{{"ok", false}, {"error", message}}.dump();
}
