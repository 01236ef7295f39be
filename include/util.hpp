// Small utility helpers
//
// `trim` and `split_words` tokenize user input, `parse_u64` converts decimal text
// without accepting signs, whitespace or trailing garbage.
#pragma once
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

// Strip leading/trailing spaces, tabs, CR and LF.
static inline std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  size_t begin = s.find_first_not_of(ws);
  if (begin == std::string::npos)
    return {};
  size_t end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

// Split on runs of whitespace.
static inline std::vector<std::string> split_words(const std::string& s) {
  std::vector<std::string> words;
  std::string current;
  for (char ch : s) {
    if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n') {
      if (!current.empty()) {
        words.push_back(current);
        current.clear();
      }
    } else {
      current.push_back(ch);
    }
  }
  if (!current.empty())
    words.push_back(current);
  return words;
}

// Decimal string -> uint64_t. Returns false on empty input, non-digits or overflow.
static inline bool parse_u64(const std::string& s, uint64_t& out) {
  if (s.empty() || s.size() > 20)
    return false;
  for (char ch : s) {
    if (ch < '0' || ch > '9')
      return false;
  }
  errno = 0;
  char* end = nullptr;
  unsigned long long v = std::strtoull(s.c_str(), &end, 10);
  if (errno == ERANGE || end != s.c_str() + s.size())
    return false;
  out = static_cast<uint64_t>(v);
  return true;
}
