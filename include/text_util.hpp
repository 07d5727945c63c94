#pragma once
// Helpers de texto compartidos por el parser de .cfg y el de trazas.

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace cachesim::text {

// Quita espacios al inicio y al final.
inline std::string trim(const std::string& s) {
  std::size_t i = 0, j = s.size();
  while (i < j && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
  return s.substr(i, j - i);
}

// Quita comentarios que empiecen con ';' o '#'
inline std::string strip_comment(const std::string& line) {
  auto pos = line.find_first_of(";#");
  if (pos == std::string::npos) return line;
  return line.substr(0, pos);
}

inline std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

// Split por espacios/tabs
inline std::vector<std::string> split_ws(const std::string& line) {
  std::vector<std::string> t;
  std::string cur;
  for (char c : line) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!cur.empty()) { t.push_back(cur); cur.clear(); }
    } else {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) t.push_back(cur);
  return t;
}

} // namespace cachesim::text
