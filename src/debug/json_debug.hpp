#pragma once
#include <algorithm>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

// Returns (line, column) from a byte position in the raw text (1-based).
inline std::pair<size_t, size_t> calc_line_col(const std::string &s,
                                               size_t byte_pos) {
  byte_pos = std::min(byte_pos, s.size());
  size_t line = 1, col = 1;
  for (size_t i = 0; i < byte_pos; ++i) {
    if (s[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  return {line, col};
}

// Small window of text around byte_pos with a caret under the offending char.
inline std::string context_snippet(const std::string &s, size_t byte_pos,
                                   size_t window = 40) {
  byte_pos = std::min(byte_pos, s.size());
  size_t start = (byte_pos > window ? byte_pos - window : 0);
  size_t end = std::min(s.size(), byte_pos + window);
  std::string snippet = s.substr(start, end - start);
  std::replace(snippet.begin(), snippet.end(), '\n', ' ');
  return snippet + "\n" + std::string(byte_pos - start, ' ') + "^";
}

// Error body for a request that failed to parse.
inline nlohmann::json parse_error_body(const std::string &raw,
                                       const nlohmann::json::parse_error &e) {
  // e.byte is 1-based and points one past the offending character
  const size_t byte = e.byte > 0 ? e.byte - 1 : 0;
  auto [line, col] = calc_line_col(raw, byte);
  return nlohmann::json{{"ok", false},
                        {"kind", "parse_error"},
                        {"error", e.what()},
                        {"line", line},
                        {"column", col},
                        {"context", context_snippet(raw, byte)}};
}
