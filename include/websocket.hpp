// WebSocket (RFC 6455) server side over a blocking socket.
//
// Overview:
// - `ws::accept_key` derives Sec-WebSocket-Accept (SHA-1 + Base64 via OpenSSL)
// - `ws::parse_frame_header` / `ws::encode_frame` are the frame codec
// - `WebSocketConnection` implements `Connection` on an upgraded socket:
//   text/binary messages are returned to the reader (fragments reassembled),
//   pings are answered, a close frame ends the stream
#pragma once
#include "connection.hpp"
#include "http.hpp"
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace ws {
enum class OpCode : uint8_t { CONTINUATION = 0x0, TEXT = 0x1, BINARY = 0x2, CLOSE = 0x8, PING = 0x9, PONG = 0xA };

struct FrameHeader {
  bool fin = false;
  OpCode opcode = OpCode::CONTINUATION;
  bool masked = false;
  uint64_t payload_len = 0;
  uint8_t mask[4] = {0, 0, 0, 0};
};

inline bool is_control(OpCode op) {
  return (static_cast<uint8_t>(op) & 0x8) != 0;
}

// Parse a header from `data`. Returns the header size, or 0 if `len` is too
// short to hold the complete header.
size_t parse_frame_header(const uint8_t* data, size_t len, FrameHeader& out);

// Unmasked server frame with FIN set.
std::vector<uint8_t> encode_frame(OpCode opcode, const std::string& payload);

// XOR `data` with the 4-byte mask in place.
void apply_mask(uint8_t* data, size_t len, const uint8_t mask[4]);

std::string accept_key(const std::string& client_key);

// Reply 101 Switching Protocols to an upgrade request.
bool send_handshake(int fd, const HttpRequest& request);
} // namespace ws

class WebSocketConnection : public Connection {
  int fd;
  std::string remote;
  std::atomic<bool> closed{false};

  // Read one frame; control frames are returned as well.
  ReadStatus read_frame(ws::FrameHeader& header, std::vector<uint8_t>& payload, std::string& error);
  bool write_frame(ws::OpCode opcode, const std::string& payload);

protected:
  bool write_text(const std::string& text) override;

public:
  // Takes ownership of `fd`; it is closed on destruction.
  WebSocketConnection(int fd, std::string remote);
  ~WebSocketConnection() override;
  WebSocketConnection(const WebSocketConnection&) = delete;
  WebSocketConnection& operator=(const WebSocketConnection&) = delete;

  ReadStatus read_text(std::string& out, std::string& error) override;
  void close() override;
  std::string peer() const override {
    return remote;
  }
};
