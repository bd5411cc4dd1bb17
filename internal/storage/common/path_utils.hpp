#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace torrentfs::storage::common {

inline constexpr std::string_view kDescriptorExtension = ".torrent";
inline constexpr std::string_view kTempSuffix          = ".tmp";

/*
  Names are paths relative to the store directory and may name a
  subdirectory ("history/v1-accounts.0-32.v"). They must not be absolute
  or climb out of the directory once normalized.
*/
inline bool IsValidName(const std::string& name) {
  if (name.empty() || name.find('\0') != std::string::npos) {
    return false;
  }

  const std::filesystem::path path(name);
  if (path.has_root_path()) {
    return false;
  }

  const auto normal = path.lexically_normal();
  if (normal.empty() || normal == "." || normal.filename().empty()) {
    return false;
  }
  return *normal.begin() != "..";
}

// A single file name inside a descriptor: no separators at all.
inline bool IsValidComponent(const std::string& component) {
  if (component.empty() || component == "." || component == "..") {
    return false;
  }
  for (char c : component) {
    if (c == '/' || c == '\\' || c == '\0') {
      return false;
    }
  }
  return true;
}

inline void ValidateName(const std::string& name) {
  if (!IsValidName(name)) {
    throw util::InvalidInput("invalid descriptor name: '" + name + "'");
  }
}

/*
  The one place names gain their extension.
  "a" -> "a.torrent", "a.torrent" -> "a.torrent".
*/
inline std::string CanonicalName(const std::string& name) {
  if (name.size() >= kDescriptorExtension.size() &&
      name.compare(name.size() - kDescriptorExtension.size(), kDescriptorExtension.size(), kDescriptorExtension) == 0) {
    return name;
  }
  return name + std::string(kDescriptorExtension);
}

inline std::filesystem::path CanonicalPath(const std::filesystem::path& path) {
  return std::filesystem::path(CanonicalName(path.string()));
}

inline std::filesystem::path DescriptorPath(const std::filesystem::path& root, const std::string& name) {
  ValidateName(name);
  return root / CanonicalName(std::filesystem::path(name).lexically_normal().string());
}

inline std::filesystem::path TempPath(const std::filesystem::path& final_path) {
  return std::filesystem::path(final_path.string() + std::string(kTempSuffix));
}

} // namespace torrentfs::storage::common
