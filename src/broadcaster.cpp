#include "broadcaster.hpp"
#include "logger.hpp"
#include "protocol.hpp"

size_t Broadcaster::broadcast() {
  Snapshot snapshot = state.snapshot();
  std::string data = encode_state(snapshot);
  size_t delivered = 0;
  for (auto& connection : snapshot.recipients) {
    if (connection->deliver(snapshot.sequence, data))
      delivered++;
    else
      Logger::log(Logger::DEBUG, Logger::with_peer(connection->peer(), "", "broadcast send failed"));
  }
  return delivered;
}
