#include "http.hpp"
#include "net.hpp"
#include "util.hpp"
#include <sstream>
#include <vector>

std::string HttpRequest::header(const std::string& name) const {
  auto it = headers.find(to_lower(name));
  return it == headers.end() ? std::string() : it->second;
}

bool HttpRequest::is_websocket_upgrade() const {
  return to_lower(header("upgrade")) == "websocket" && !header("sec-websocket-key").empty();
}

static bool parse_request_line(const std::string& line, HttpRequest& out) {
  std::istringstream iss(line);
  std::string target;
  if (!(iss >> out.method >> target >> out.version))
    return false;
  if (!starts_with(out.version, "HTTP/") || target.empty())
    return false;
  size_t q = target.find('?');
  out.path = target.substr(0, q);
  out.query = q == std::string::npos ? std::string() : target.substr(q + 1);
  return true;
}

static bool parse_header_line(const std::string& line, HttpRequest& out) {
  size_t colon = line.find(':');
  if (colon == std::string::npos || colon == 0)
    return false;
  out.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
  return true;
}

bool read_request(int fd, HttpRequest& out) {
  out = HttpRequest{};
  std::string line;
  if (!net::read_line(fd, line, MAX_HEADER_LINE) || !parse_request_line(line, out))
    return false;
  for (int count = 0;; count++) {
    if (count > MAX_HEADER_COUNT || !net::read_line(fd, line, MAX_HEADER_LINE))
      return false;
    if (line.empty())
      break;
    if (!parse_header_line(line, out))
      return false;
  }
  // Drain a small body so the peer isn't reset before reading the reply.
  std::string length = out.header("content-length");
  if (!length.empty()) {
    size_t n = 0;
    try {
      n = std::stoul(length);
    } catch (const std::exception&) {
      return false;
    }
    if (n > MAX_HEADER_LINE)
      return false;
    std::vector<uint8_t> body(n);
    if (n > 0 && !net::read_exact(fd, body.data(), n))
      return false;
  }
  return true;
}

const char* status_text(int status) {
  switch (status) {
    case 200:
      return "OK";
    case 204:
      return "No Content";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 500:
      return "Internal Server Error";
  }
  return "Unknown";
}

bool send_response(int fd, int status, const std::string& content_type, const std::string& body) {
  std::ostringstream oss;
  oss << "HTTP/1.1 " << status << ' ' << status_text(status) << "\r\n"
      << "Access-Control-Allow-Origin: *\r\n"
      << "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
      << "Access-Control-Allow-Headers: Content-Type\r\n";
  if (!content_type.empty())
    oss << "Content-Type: " << content_type << "\r\n";
  oss << "Content-Length: " << body.size() << "\r\n"
      << "Connection: close\r\n\r\n"
      << body;
  return net::send_all(fd, oss.str());
}
