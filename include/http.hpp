// Minimal HTTP/1.1 handling for the query and upgrade endpoints.
//
// Only what the server needs: one request per connection, request line and
// headers parsed, body skipped, response always `Connection: close` unless
// the request is upgraded to a WebSocket.
#pragma once
#include <map>
#include <string>

#define MAX_HEADER_LINE 8192
#define MAX_HEADER_COUNT 100

struct HttpRequest {
  std::string method;
  std::string path;   // without query string
  std::string query;
  std::string version;
  std::map<std::string, std::string> headers; // names lower-cased

  // Empty string if absent.
  std::string header(const std::string& name) const;
  // Upgrade: websocket plus a Sec-WebSocket-Key.
  bool is_websocket_upgrade() const;
};

// Parse the request line and headers from `fd`.
// Returns false on EOF, timeout, or malformed input.
bool read_request(int fd, HttpRequest& out);

// Send a complete response with permissive CORS headers.
bool send_response(int fd, int status, const std::string& content_type, const std::string& body);

const char* status_text(int status);
