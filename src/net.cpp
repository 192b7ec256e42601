#include "net.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace net {
bool send_all(int fd, const uint8_t* data, size_t len) {
  size_t sent = 0;
  while (sent < len) {
    ssize_t rc = send(fd, data + sent, len - sent, MSG_NOSIGNAL);
    if (rc > 0) {
      sent += static_cast<size_t>(rc);
      continue;
    }
    if (rc == 0) {
      return false; // peer closed
    }
    if (errno == EINTR)
      continue;
    return false;
  }
  return true;
}

bool send_all(int fd, const std::string& data) {
  return send_all(fd, reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

int recv_exact(int fd, void* dst, size_t n) {
  uint8_t* buf = reinterpret_cast<uint8_t*>(dst);
  size_t total = 0;

  while (total < n) {
    ssize_t bytes = recv(fd, buf + total, n - total, 0);

    if (bytes == 0) {
      return total == 0 ? 0 : -1;
    }

    if (bytes < 0) {
      if (errno == EINTR)
        continue;
      return -1;
    }

    total += static_cast<size_t>(bytes);
  }

  return 1;
}

bool read_exact(int fd, void* dst, size_t n) {
  return recv_exact(fd, dst, n) == 1;
}

bool read_line(int fd, std::string& out, size_t max_len) {
  out.clear();
  char ch;
  while (read_exact(fd, &ch, 1)) {
    if (ch == '\n') {
      if (!out.empty() && out.back() == '\r')
        out.pop_back();
      return true;
    }
    if (out.size() >= max_len)
      return false;
    out.push_back(ch);
  }
  return false;
}

std::string peer_address(int fd) {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0 || addr.sin_family != AF_INET)
    return "unknown";
  char ip[INET_ADDRSTRLEN] = {0};
  inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
  return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

void set_read_timeout(int fd, int seconds) {
  timeval tv{};
  tv.tv_sec = seconds;
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}
} // namespace net
