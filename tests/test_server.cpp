#include <catch2/catch.hpp>

#include "server.hpp"
#include "test_client.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <thread>

using json = nlohmann::json;
using namespace test_helpers;

namespace {

// Wait until `pred` holds for the next state message.
template <typename Pred>
bool recv_until(WsClient& client, Pred pred, json& out) {
  std::string text;
  for (int i = 0; i < 20; i++) {
    if (!client.recv_text(text))
      return false;
    out = json::parse(text);
    if (pred(out))
      return true;
  }
  return false;
}

} // namespace

TEST_CASE("Maze queries over HTTP", "[server]") {
  GameState state(31, 21);
  Server server(state, 0);
  server.start();

  json info = json::parse(response_body(http_request(server.port(), "GET", "/info")));
  REQUIRE(info["width"] == 31);
  REQUIRE(info["height"] == 21);
  REQUIRE(info["goalX"] == 29);
  REQUIRE(info["goalY"] == 19);

  std::string raw = http_request(server.port(), "GET", "/maze");
  REQUIRE(raw.find("Access-Control-Allow-Origin: *") != std::string::npos);
  json grid = json::parse(response_body(raw));
  REQUIRE(grid.size() == 21);
  REQUIRE(grid[0].size() == 31);
  REQUIRE(grid[1][1] == 0);

  REQUIRE(http_request(server.port(), "GET", "/nowhere").rfind("HTTP/1.1 404", 0) == 0);
  REQUIRE(http_request(server.port(), "DELETE", "/maze").rfind("HTTP/1.1 405", 0) == 0);
  REQUIRE(http_request(server.port(), "OPTIONS", "/maze").rfind("HTTP/1.1 204", 0) == 0);
  REQUIRE(http_request(server.port(), "GET", "/ws").rfind("HTTP/1.1 400", 0) == 0);

  server.stop();
}

TEST_CASE("Two players race over WebSocket", "[server]") {
  GameState state(31, 21);
  Server server(state, 0);
  server.start();

  WsClient p1;
  REQUIRE(p1.open(server.port()));
  json msg;
  REQUIRE(recv_until(p1, [](const json& j) { return j["players"].size() == 1; }, msg));

  WsClient p2;
  REQUIRE(p2.open(server.port()));
  REQUIRE(recv_until(p1, [](const json& j) { return j["players"].size() == 2; }, msg));

  REQUIRE(p1.send_text(R"({"x":29,"y":19,"name":"P1","color":"#f00","finished":true})"));
  REQUIRE(recv_until(p2, [](const json& j) {
    for (const auto& p : j["players"])
      if (p["name"] == "P1" && p["finishRank"] == 1)
        return true;
    return false;
  }, msg));
  REQUIRE(msg["gameOver"] == false);

  REQUIRE(p2.send_text(R"({"x":29,"y":19,"name":"P2","color":"#0f0","finished":true})"));
  REQUIRE(recv_until(p1, [](const json& j) { return j["gameOver"] == true; }, msg));
  REQUIRE(msg["allFinished"] == true);

  // Reset: ack, then everyone is back at spawn.
  json ack = json::parse(response_body(http_request(server.port(), "POST", "/reset")));
  REQUIRE(ack["ok"] == true);
  REQUIRE(recv_until(p1, [](const json& j) { return j["gameOver"] == false; }, msg));
  for (const auto& p : msg["players"]) {
    REQUIRE(p["finished"] == false);
    REQUIRE(p["finishRank"] == 0);
    REQUIRE(p["x"] == 1);
  }

  // Departure is broadcast to the remaining client.
  p2.close();
  REQUIRE(recv_until(p1, [](const json& j) { return j["players"].size() == 1; }, msg));

  server.stop();
  REQUIRE(state.player_count() == 0);
}

TEST_CASE("Garbage on the socket drops only that client", "[server]") {
  GameState state(31, 21);
  Server server(state, 0);
  server.start();

  WsClient good;
  REQUIRE(good.open(server.port()));
  WsClient bad;
  REQUIRE(bad.open(server.port()));
  json msg;
  REQUIRE(recv_until(good, [](const json& j) { return j["players"].size() == 2; }, msg));

  REQUIRE(bad.send_text("definitely not json"));
  REQUIRE(recv_until(good, [](const json& j) { return j["players"].size() == 1; }, msg));

  server.stop();
}

TEST_CASE("Stop closes live sessions", "[server]") {
  GameState state(31, 21);
  Server server(state, 0);
  server.start();

  WsClient client;
  REQUIRE(client.open(server.port()));
  json msg;
  REQUIRE(recv_until(client, [](const json& j) { return j["players"].size() == 1; }, msg));

  server.stop();
  REQUIRE_FALSE(server.is_running());
  REQUIRE(state.player_count() == 0);
}
