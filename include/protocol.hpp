// Wire protocol: JSON documents exchanged with clients.
//
// Overview:
// - Client -> server (WebSocket text): {x, y, name, color, finished}
//   Missing or null fields take zero/empty values; wrongly typed fields and
//   coordinates that are fractional or outside int range are errors.
// - Server -> client (WebSocket text): {allFinished, gameOver, players: [...]}
//   each player as {x, y, name, color, finished, finishRank, finishTime}
// - HTTP bodies: maze grid (array of rows), maze info, reset ack, errors
#pragma once
#include "game_state.hpp"
#include <string>
#include <vector>

// Upper bound for an inbound message in bytes.
#define MAX_PAYLOAD_SIZE (64 * 1024)

// Parse a client update. On failure returns false and fills `error`.
bool decode_player_update(const std::string& text, PlayerUpdate& out, std::string& error);

std::string encode_state(const Snapshot& snapshot);
std::string encode_maze(const std::vector<std::vector<int>>& grid);
std::string encode_maze_info(const MazeInfo& info);
std::string encode_ack();
std::string encode_error(const std::string& message);
