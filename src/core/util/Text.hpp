#pragma once
#include <string>

namespace ipe {

// Strips leading and trailing spaces, tabs, CR and LF.
inline std::string trim(const std::string& s) {
  const char* ws = " \t\r\n";
  const size_t b = s.find_first_not_of(ws);
  if (b == std::string::npos) return {};
  const size_t e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

} // namespace ipe
