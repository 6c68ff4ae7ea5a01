#ifndef MATHGRADE_UTIL_STRING_H_
#define MATHGRADE_UTIL_STRING_H_

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace mathgrade::util {

inline bool IsSpace(char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

inline std::string Trim(std::string_view input) {
  size_t start = 0;
  while (start < input.size() && IsSpace(input[start])) {
    ++start;
  }
  size_t end = input.size();
  while (end > start && IsSpace(input[end - 1])) {
    --end;
  }
  return std::string(input.substr(start, end - start));
}

/// Removes every whitespace character, keeping the remaining characters in order.
inline std::string StripWhitespace(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (char ch : input) {
    if (!IsSpace(ch)) {
      out.push_back(ch);
    }
  }
  return out;
}

/// Splits on a delimiter, trimming each piece and dropping empty pieces.
inline std::vector<std::string> Split(const std::string& input, char delim) {
  std::vector<std::string> parts;
  std::string current;
  for (char ch : input) {
    if (ch == delim) {
      std::string piece = Trim(current);
      if (!piece.empty()) parts.push_back(piece);
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  std::string piece = Trim(current);
  if (!piece.empty()) parts.push_back(piece);
  return parts;
}

inline std::string Join(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += sep;
    out += parts[i];
  }
  return out;
}

inline std::string ToLower(std::string_view input) {
  std::string out(input);
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

}  // namespace mathgrade::util

#endif  // MATHGRADE_UTIL_STRING_H_
