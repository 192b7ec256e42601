#pragma once
// Broadcaster: fans the current game state out to every connected client.
//
// A snapshot is taken under GameState's lock; encoding and every send happen
// after the lock is released. A failed send to one client is ignored: that
// client's own session notices the dead transport and cleans up.
#include "game_state.hpp"

class Broadcaster {
  GameState& state;

public:
  explicit Broadcaster(GameState& state) : state(state) {}
  // Snapshot, encode, deliver. Returns how many clients were reached.
  size_t broadcast();
};
