#include "ImageReference.hpp"

#include <regex>
#include <vector>

namespace ipe {

namespace {

constexpr size_t kMaxNameLength = 255;
// Checked before any regex runs: libstdc++ regex_match recurses per character.
constexpr size_t kMaxReferenceLength = 512;

const std::regex& pathComponentRe() {
  static const std::regex re("[a-z0-9]+(?:(?:[._]|__|-+)[a-z0-9]+)*");
  return re;
}

const std::regex& domainRe() {
  static const std::regex re(
      "(?:[a-zA-Z0-9]|[a-zA-Z0-9][a-zA-Z0-9-]*[a-zA-Z0-9])"
      "(?:\\.(?:[a-zA-Z0-9]|[a-zA-Z0-9][a-zA-Z0-9-]*[a-zA-Z0-9]))*"
      "(?::[0-9]+)?");
  return re;
}

const std::regex& tagRe() {
  static const std::regex re("[A-Za-z0-9_][A-Za-z0-9_.-]{0,127}");
  return re;
}

const std::regex& digestRe() {
  static const std::regex re("[A-Za-z][A-Za-z0-9]*(?:[-_+.][A-Za-z][A-Za-z0-9]*)*:[0-9a-fA-F]{32,128}");
  return re;
}

std::vector<std::string_view> split(std::string_view s, char sep) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  for (;;) {
    size_t pos = s.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(s.substr(start));
      return parts;
    }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
}

bool matches(std::string_view s, const std::regex& re) {
  return std::regex_match(s.begin(), s.end(), re);
}

// Same rule docker uses to tell "host/repo" from "user/repo".
bool looksLikeRegistry(std::string_view first) {
  return first.find('.') != std::string_view::npos ||
         first.find(':') != std::string_view::npos ||
         first == "localhost";
}

} // namespace

std::optional<ImageReference> parse_image_reference(std::string_view s) {
  if (s.empty() || s.size() > kMaxReferenceLength) return std::nullopt;

  ImageReference ref;

  std::string_view nameTag = s;
  if (size_t at = s.find('@'); at != std::string_view::npos) {
    std::string_view digest = s.substr(at + 1);
    if (!matches(digest, digestRe())) return std::nullopt;
    ref.digest = std::string(digest);
    nameTag = s.substr(0, at);
  }

  std::string_view name = nameTag;
  const size_t colon = nameTag.rfind(':');
  const size_t slash = nameTag.rfind('/');
  if (colon != std::string_view::npos &&
      (slash == std::string_view::npos || colon > slash)) {
    std::string_view tag = nameTag.substr(colon + 1);
    if (!matches(tag, tagRe())) return std::nullopt;
    ref.tag = std::string(tag);
    name = nameTag.substr(0, colon);
  }

  if (name.empty() || name.size() > kMaxNameLength) return std::nullopt;

  auto parts = split(name, '/');
  size_t firstPath = 0;
  if (parts.size() > 1 && looksLikeRegistry(parts[0])) {
    if (!matches(parts[0], domainRe())) return std::nullopt;
    ref.registry = std::string(parts[0]);
    firstPath = 1;
  } else {
    ref.registry = kDefaultRegistry;
  }

  for (size_t i = firstPath; i < parts.size(); ++i) {
    if (!matches(parts[i], pathComponentRe())) return std::nullopt;
  }
  ref.repository = std::string(name.substr(firstPath == 0 ? 0 : parts[0].size() + 1));
  return ref;
}

} // namespace ipe
