// Small utility helpers
//
// `starts_with` provides a simple string prefix check.
// `to_lower` and `trim` normalize HTTP header names and values.
// `check` throws std::runtime_error (with errno text) when a syscall-like
// function returns < 0.
#pragma once
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

// True if `s` starts with `prefix`.
static inline bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static inline std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Strip leading/trailing spaces and tabs.
static inline std::string trim(const std::string& s) {
  size_t b = s.find_first_not_of(" \t");
  if (b == std::string::npos)
    return {};
  size_t e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

// Throw if result < 0; returns `result` otherwise.
static inline int check(int result, const char* funcname) {
  if (result < 0)
    throw std::runtime_error(std::string(funcname) + ": " + std::strerror(errno));
  return result;
}
