#include "PullEvent.hpp"

#include <cctype>

namespace ipe {

std::optional<Outcome> parse_outcome(std::string_view s) {
  std::string lower(s.size(), '\0');
  for (size_t i = 0; i < s.size(); ++i)
    lower[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(s[i])));
  if (lower == "success") return Outcome::Success;
  if (lower == "failure") return Outcome::Failure;
  return std::nullopt;
}

} // namespace ipe
