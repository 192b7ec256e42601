#include "websocket.hpp"
#include "logger.hpp"
#include "net.hpp"
#include "protocol.hpp"
#include <cerrno>
#include <cstring>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace ws {
static const char* kGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

size_t parse_frame_header(const uint8_t* data, size_t len, FrameHeader& out) {
  if (len < 2)
    return 0;
  out.fin = (data[0] & 0x80) != 0;
  out.opcode = static_cast<OpCode>(data[0] & 0x0F);
  out.masked = (data[1] & 0x80) != 0;
  uint64_t plen = data[1] & 0x7F;
  size_t header_size = 2;
  if (plen == 126) {
    if (len < 4)
      return 0;
    plen = (static_cast<uint64_t>(data[2]) << 8) | data[3];
    header_size = 4;
  } else if (plen == 127) {
    if (len < 10)
      return 0;
    plen = 0;
    for (int i = 2; i < 10; ++i)
      plen = (plen << 8) | data[i];
    header_size = 10;
  }
  out.payload_len = plen;
  if (out.masked) {
    if (len < header_size + 4)
      return 0;
    for (int i = 0; i < 4; ++i)
      out.mask[i] = data[header_size + i];
    header_size += 4;
  }
  return header_size;
}

std::vector<uint8_t> encode_frame(OpCode opcode, const std::string& payload) {
  std::vector<uint8_t> frame;
  frame.reserve(payload.size() + 10);
  frame.push_back(0x80 | static_cast<uint8_t>(opcode));
  size_t len = payload.size();
  if (len < 126) {
    frame.push_back(static_cast<uint8_t>(len));
  } else if (len < 65536) {
    frame.push_back(126);
    frame.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
    frame.push_back(static_cast<uint8_t>(len & 0xFF));
  } else {
    frame.push_back(127);
    for (int i = 7; i >= 0; --i)
      frame.push_back(static_cast<uint8_t>((static_cast<uint64_t>(len) >> (i * 8)) & 0xFF));
  }
  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

void apply_mask(uint8_t* data, size_t len, const uint8_t mask[4]) {
  for (size_t i = 0; i < len; ++i)
    data[i] ^= mask[i % 4];
}

std::string accept_key(const std::string& client_key) {
  std::string input = client_key + kGuid;
  unsigned char digest[SHA_DIGEST_LENGTH];
  unsigned int digest_len = 0;
  if (EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_sha1(), nullptr) != 1)
    throw std::runtime_error("SHA-1 digest failed");
  // Base64 of 20 bytes is 28 chars plus NUL.
  unsigned char encoded[4 * ((SHA_DIGEST_LENGTH + 2) / 3) + 1];
  int n = EVP_EncodeBlock(encoded, digest, static_cast<int>(digest_len));
  return std::string(reinterpret_cast<const char*>(encoded), static_cast<size_t>(n));
}

bool send_handshake(int fd, const HttpRequest& request) {
  std::string response = "HTTP/1.1 101 Switching Protocols\r\n"
                         "Upgrade: websocket\r\n"
                         "Connection: Upgrade\r\n"
                         "Sec-WebSocket-Accept: " +
                         accept_key(request.header("sec-websocket-key")) + "\r\n\r\n";
  return net::send_all(fd, response);
}
} // namespace ws

WebSocketConnection::WebSocketConnection(int fd, std::string remote) : fd(fd), remote(std::move(remote)) {}

WebSocketConnection::~WebSocketConnection() {
  close();
  ::close(fd);
}

ReadStatus WebSocketConnection::read_frame(ws::FrameHeader& header, std::vector<uint8_t>& payload, std::string& error) {
  uint8_t buf[14];
  int rc = net::recv_exact(fd, buf, 2);
  if (rc <= 0) {
    if (rc == 0 || closed)
      return ReadStatus::END_OF_STREAM;
    error = std::strerror(errno);
    return ReadStatus::TRANSPORT_ERROR;
  }

  size_t need = 2;
  uint8_t len7 = buf[1] & 0x7F;
  if (len7 == 126)
    need += 2;
  else if (len7 == 127)
    need += 8;
  if (buf[1] & 0x80)
    need += 4;
  if (need > 2 && !net::read_exact(fd, buf + 2, need - 2)) {
    error = "truncated frame header";
    return ReadStatus::TRANSPORT_ERROR;
  }
  ws::parse_frame_header(buf, need, header);

  if (!header.masked) {
    error = "unmasked client frame";
    return ReadStatus::PROTOCOL_ERROR;
  }
  if (header.payload_len > MAX_PAYLOAD_SIZE) {
    error = "frame too large (" + std::to_string(header.payload_len) + " bytes)";
    return ReadStatus::PROTOCOL_ERROR;
  }
  if (ws::is_control(header.opcode) && (!header.fin || header.payload_len > 125)) {
    error = "invalid control frame";
    return ReadStatus::PROTOCOL_ERROR;
  }

  payload.resize(static_cast<size_t>(header.payload_len));
  if (!payload.empty() && !net::read_exact(fd, payload.data(), payload.size())) {
    error = "truncated frame payload";
    return ReadStatus::TRANSPORT_ERROR;
  }
  ws::apply_mask(payload.data(), payload.size(), header.mask);
  return ReadStatus::OK;
}

ReadStatus WebSocketConnection::read_text(std::string& out, std::string& error) {
  out.clear();
  bool in_message = false;
  while (true) {
    ws::FrameHeader header;
    std::vector<uint8_t> payload;
    ReadStatus status = read_frame(header, payload, error);
    if (status != ReadStatus::OK)
      return status;

    switch (header.opcode) {
      case ws::OpCode::TEXT:
      case ws::OpCode::BINARY:
        if (in_message) {
          error = "new message inside a fragmented message";
          return ReadStatus::PROTOCOL_ERROR;
        }
        in_message = true;
        break;
      case ws::OpCode::CONTINUATION:
        if (!in_message) {
          error = "continuation without a message";
          return ReadStatus::PROTOCOL_ERROR;
        }
        break;
      case ws::OpCode::PING: {
        std::lock_guard<std::mutex> lock(write_mutex);
        if (!write_frame(ws::OpCode::PONG, std::string(payload.begin(), payload.end())))
          return ReadStatus::TRANSPORT_ERROR;
        continue;
      }
      case ws::OpCode::PONG:
        continue;
      case ws::OpCode::CLOSE:
        close();
        return ReadStatus::END_OF_STREAM;
      default:
        error = "unknown opcode " + std::to_string(static_cast<int>(header.opcode));
        return ReadStatus::PROTOCOL_ERROR;
    }

    out.append(payload.begin(), payload.end());
    if (out.size() > MAX_PAYLOAD_SIZE) {
      error = "message too large";
      return ReadStatus::PROTOCOL_ERROR;
    }
    if (header.fin)
      return ReadStatus::OK;
  }
}

bool WebSocketConnection::write_frame(ws::OpCode opcode, const std::string& payload) {
  std::vector<uint8_t> frame = ws::encode_frame(opcode, payload);
  return net::send_all(fd, frame.data(), frame.size());
}

bool WebSocketConnection::write_text(const std::string& text) {
  if (closed)
    return false;
  return write_frame(ws::OpCode::TEXT, text);
}

void WebSocketConnection::close() {
  if (closed.exchange(true))
    return;
  // Skip the close frame if a send is in flight; shutdown() unblocks it.
  std::unique_lock<std::mutex> lock(write_mutex, std::try_to_lock);
  if (lock.owns_lock()) {
    // Status 1000, normal closure.
    std::string body("\x03\xe8", 2);
    if (!write_frame(ws::OpCode::CLOSE, body))
      Logger::log(Logger::DEBUG, Logger::with_peer(remote, "", "close frame not delivered"));
  }
  shutdown(fd, SHUT_RDWR);
}
