#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace ipe {

constexpr const char* kDefaultRegistry = "docker.io";

// A docker image reference: [registry[:port]/]path[:tag][@algo:hex]
struct ImageReference {
  std::string registry;   // kDefaultRegistry when the reference names none
  std::string repository;
  std::string tag;        // empty when absent
  std::string digest;     // empty when absent
};

// nullopt if s is not a syntactically valid reference.
std::optional<ImageReference> parse_image_reference(std::string_view s);

} // namespace ipe
