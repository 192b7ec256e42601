#include <catch2/catch.hpp>

#include "protocol.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

TEST_CASE("Client update decodes every field", "[protocol]") {
  PlayerUpdate u;
  std::string error;
  REQUIRE(decode_player_update(R"({"x":5,"y":9,"name":"Ada","color":"#abcdef","finished":true})", u, error));
  REQUIRE(u.x == 5);
  REQUIRE(u.y == 9);
  REQUIRE(u.name == "Ada");
  REQUIRE(u.color == "#abcdef");
  REQUIRE(u.finished);
}

TEST_CASE("Missing fields take zero values", "[protocol]") {
  PlayerUpdate u;
  std::string error;
  REQUIRE(decode_player_update(R"({"x":3})", u, error));
  REQUIRE(u.x == 3);
  REQUIRE(u.y == 0);
  REQUIRE(u.name.empty());
  REQUIRE(u.color.empty());
  REQUIRE_FALSE(u.finished);
}

TEST_CASE("Unknown fields are ignored", "[protocol]") {
  PlayerUpdate u;
  std::string error;
  REQUIRE(decode_player_update(R"({"x":1,"y":1,"finishRank":99,"extra":[1,2]})", u, error));
  REQUIRE(u.x == 1);
}

TEST_CASE("Malformed updates are rejected", "[protocol]") {
  PlayerUpdate u;
  std::string error;
  auto bad = GENERATE(as<std::string>{}, "not json", "[1,2,3]", R"({"x":"left"})", R"({"finished":"yes"})", R"({"name":42})", "",
                      R"({"x":3.7})", R"({"x":5000000000})", R"({"y":1e300})", R"({"y":-5000000000})",
                      R"({"x":18446744073709551615})");
  REQUIRE_FALSE(decode_player_update(bad, u, error));
  REQUIRE_FALSE(error.empty());
}

TEST_CASE("Coordinates at the int limits are accepted", "[protocol]") {
  PlayerUpdate u;
  std::string error;
  REQUIRE(decode_player_update(R"({"x":2147483647,"y":-2147483648})", u, error));
  CHECK(u.x == 2147483647);
  CHECK(u.y == -2147483647 - 1);
  REQUIRE_FALSE(decode_player_update(R"({"x":2147483648})", u, error));
}

TEST_CASE("Null fields are treated as missing", "[protocol]") {
  PlayerUpdate u;
  std::string error;
  REQUIRE(decode_player_update(R"({"x":2,"y":null,"name":null,"color":null,"finished":null})", u, error));
  CHECK(u.x == 2);
  CHECK(u.y == 0);
  CHECK(u.name.empty());
  CHECK(u.color.empty());
  CHECK_FALSE(u.finished);
}

TEST_CASE("Oversized updates are rejected", "[protocol]") {
  PlayerUpdate u;
  std::string error;
  std::string huge = R"({"name":")" + std::string(MAX_PAYLOAD_SIZE, 'a') + R"("})";
  REQUIRE_FALSE(decode_player_update(huge, u, error));
}

TEST_CASE("State message carries flags and full player records", "[protocol]") {
  Snapshot s;
  s.all_finished = true;
  s.game_over = true;
  Player p;
  p.x = 29;
  p.y = 19;
  p.name = "Ada";
  p.color = "#00ff00";
  p.finished = true;
  p.finish_rank = 1;
  p.finish_time = 42;
  s.players.push_back(p);

  json j = json::parse(encode_state(s));
  REQUIRE(j["allFinished"] == true);
  REQUIRE(j["gameOver"] == true);
  REQUIRE(j["players"].size() == 1);
  const json& jp = j["players"][0];
  REQUIRE(jp["x"] == 29);
  REQUIRE(jp["y"] == 19);
  REQUIRE(jp["name"] == "Ada");
  REQUIRE(jp["color"] == "#00ff00");
  REQUIRE(jp["finished"] == true);
  REQUIRE(jp["finishRank"] == 1);
  REQUIRE(jp["finishTime"] == 42);
}

TEST_CASE("Empty state still has a players array", "[protocol]") {
  json j = json::parse(encode_state(Snapshot{}));
  REQUIRE(j["players"].is_array());
  REQUIRE(j["players"].empty());
  REQUIRE(j["allFinished"] == false);
}

TEST_CASE("Maze and info replies", "[protocol]") {
  json grid = json::parse(encode_maze({{1, 1, 1}, {1, 0, 1}}));
  REQUIRE(grid.size() == 2);
  REQUIRE(grid[1][1] == 0);

  json info = json::parse(encode_maze_info(MazeInfo{69, 39, 71, 41}));
  REQUIRE(info["goalX"] == 69);
  REQUIRE(info["goalY"] == 39);
  REQUIRE(info["width"] == 71);
  REQUIRE(info["height"] == 41);

  REQUIRE(json::parse(encode_ack())["ok"] == true);
  REQUIRE(json::parse(encode_error("nope"))["error"] == "nope");
}
