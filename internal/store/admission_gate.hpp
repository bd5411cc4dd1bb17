#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace torrentfs::store {

/*
  Admission control for new downloads ("download once" mode).

  State lives in <dir>/prohibit_new_downloads.lock, a JSON array of patterns:

    file absent        → every name may start a new download
    file present       → only names containing one of the patterns may
    (even "[]" or "")

  Once the node has downloaded its initial set it writes the file, so
  restarts and upgrades only seed or repair what is already on disk.
*/
class AdmissionGate {
 public:
  static constexpr char kFileName[] = "prohibit_new_downloads.lock";

  explicit AdmissionGate(std::filesystem::path dir);

  /*
    Apply remove, then add, to the stored whitelist and rewrite it atomically.
    Creates the file when absent, which turns the restriction on.

    Returns the new whitelist, sorted and without duplicates.
    Throws util::DecodeError for a malformed existing file and
    util::WhitelistWriteError (carrying the computed list) when the rewrite fails.
  */
  std::vector<std::string> ProhibitNewDownloads(const std::vector<std::string>& add, const std::vector<std::string>& remove);

  bool NewDownloadsAreProhibited(const std::string& name) const;

  // std::nullopt when no restriction is in place.
  std::optional<std::vector<std::string>> Whitelist() const;

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  std::optional<std::vector<std::string>> ReadWhitelist() const;

  std::filesystem::path path_;

  mutable std::mutex mutex_;
};

} // namespace torrentfs::store
