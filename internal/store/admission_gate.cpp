#include "admission_gate.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <set>
#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/disk/atomic_file.hpp"
#include "internal/util/errors.hpp"

namespace torrentfs::store {

using namespace torrentfs::storage::common;
using torrentfs::observability::IntField;
using torrentfs::observability::StringField;

namespace {

// Whitelist <-> JSON array via protobuf's well-known ListValue.

std::string MarshalWhitelist(const std::vector<std::string>& whitelist, const std::filesystem::path& path) {
  google::protobuf::ListValue list;
  for (const auto& pattern : whitelist) {
    list.add_values()->set_string_value(pattern);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(list, &json);
  if (!status.ok()) {
    throw util::InvalidInput("marshal " + path.string() + ": " + std::string(status.message()));
  }
  return json;
}

std::vector<std::string> UnmarshalWhitelist(std::string_view json, const std::filesystem::path& path) {
  std::vector<std::string> whitelist;
  if (json.empty()) {
    return whitelist;
  }

  google::protobuf::ListValue list;
  auto                        status = google::protobuf::util::JsonStringToMessage(std::string(json), &list);
  if (!status.ok()) {
    throw util::DecodeError("unmarshal " + path.string() + ": " + std::string(status.message()));
  }

  whitelist.reserve(static_cast<size_t>(list.values_size()));
  for (const auto& value : list.values()) {
    if (value.kind_case() != google::protobuf::Value::kStringValue) {
      throw util::DecodeError("unmarshal " + path.string() + ": whitelist entries must be strings");
    }
    whitelist.push_back(value.string_value());
  }
  return whitelist;
}

} // namespace

AdmissionGate::AdmissionGate(std::filesystem::path dir) : path_(dir / kFileName) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw util::IoError("create directory " + dir.string() + ": " + ec.message());
  }
}

// ------------------------------------------------------------
// ProhibitNewDownloads
// ------------------------------------------------------------

std::vector<std::string> AdmissionGate::ProhibitNewDownloads(const std::vector<std::string>& add, const std::vector<std::string>& remove) {
  std::unique_lock lock(mutex_);

  std::set<std::string> patterns;
  if (auto current = ReadWhitelist()) {
    patterns.insert(current->begin(), current->end());
  }
  for (const auto& pattern : remove) {
    patterns.erase(pattern);
  }
  patterns.insert(add.begin(), add.end());

  std::vector<std::string> whitelist(patterns.begin(), patterns.end());
  const auto               json = MarshalWhitelist(whitelist, path_);

  try {
    storage::disk::AtomicWrite(path_, WrapBytes(json));
  } catch (const util::IoError& e) {
    throw util::WhitelistWriteError(std::string("write whitelist: ") + e.what(), std::move(whitelist));
  }

  TORRENTFS_LOG_INFO("new downloads prohibited", {StringField("path", path_.string()), IntField("whitelist_size", static_cast<int64_t>(whitelist.size()))});
  return whitelist;
}

// ------------------------------------------------------------
// NewDownloadsAreProhibited
// ------------------------------------------------------------

bool AdmissionGate::NewDownloadsAreProhibited(const std::string& name) const {
  std::unique_lock lock(mutex_);

  const auto whitelist = ReadWhitelist();
  if (!whitelist) {
    return false;
  }

  for (const auto& pattern : *whitelist) {
    if (name.find(pattern) != std::string::npos) {
      return false;
    }
  }
  return true;
}

std::optional<std::vector<std::string>> AdmissionGate::Whitelist() const {
  std::unique_lock lock(mutex_);
  return ReadWhitelist();
}

// caller holds mutex_
std::optional<std::vector<std::string>> AdmissionGate::ReadWhitelist() const {
  if (!storage::disk::FileExists(path_)) {
    return std::nullopt;
  }

  auto buffer = storage::disk::ReadFile(path_);
  return UnmarshalWhitelist(AsStringView(*buffer), path_);
}

} // namespace torrentfs::store
