// Connection: one client's duplex message channel.
//
// Responsibilities:
// - Read one complete inbound text message at a time (blocking)
// - Send outbound text messages; failures are reported, never thrown
// - Drop stale broadcast snapshots via `deliver()`
//
// Concurrency:
// - A single session thread reads; any thread may send
// - Sends are serialized by the connection's own write mutex so frames from
//   concurrent broadcasts never interleave on the wire
#pragma once
#include <cstdint>
#include <mutex>
#include <string>

// Why a read loop ended.
enum class ReadStatus { OK, END_OF_STREAM, TRANSPORT_ERROR, PROTOCOL_ERROR };

class Connection {
  uint64_t last_sequence = 0;

protected:
  // Held around every outbound write.
  std::mutex write_mutex;

  // Implementations send one message; called with `write_mutex` held.
  virtual bool write_text(const std::string& text) = 0;

public:
  virtual ~Connection() = default;

  // Block until a full text message arrives in `out`.
  // `error` receives a short description for TRANSPORT_ERROR/PROTOCOL_ERROR.
  virtual ReadStatus read_text(std::string& out, std::string& error) = 0;
  // Close the transport. Idempotent; unblocks a pending `read_text`.
  virtual void close() = 0;
  // Printable remote address for logging.
  virtual std::string peer() const = 0;

  // Send a message outside any snapshot ordering.
  bool send_text(const std::string& text) {
    std::lock_guard<std::mutex> lock(write_mutex);
    return write_text(text);
  }

  // Send snapshot number `sequence`. Snapshots at or below the last one
  // delivered are skipped and count as success.
  bool deliver(uint64_t sequence, const std::string& text) {
    std::lock_guard<std::mutex> lock(write_mutex);
    if (sequence <= last_sequence)
      return true;
    last_sequence = sequence;
    return write_text(text);
  }
};
