#include "descriptor_store.hpp"

#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/disk/atomic_file.hpp"
#include "internal/util/errors.hpp"

namespace torrentfs::store {

using namespace torrentfs::storage::common;
using namespace torrentfs::v1;
using torrentfs::observability::BoolField;
using torrentfs::observability::IntField;
using torrentfs::observability::StringField;

DescriptorStore::DescriptorStore(std::filesystem::path dir, codec::AnnounceList announce_list)
    : dir_(std::move(dir)), announce_list_(std::move(announce_list)) {

  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    throw util::IoError("create directory " + dir_.string() + ": " + ec.message());
  }
}

// ------------------------------------------------------------
// Exists
// ------------------------------------------------------------

bool DescriptorStore::Exists(const std::string& name) const {
  if (!IsValidName(name)) {
    return false;
  }

  const auto path = DescriptorPath(dir_, name);

  std::unique_lock lock(mutex_);
  return storage::disk::FileExists(path);
}

// ------------------------------------------------------------
// Delete
// ------------------------------------------------------------

void DescriptorStore::Delete(const std::string& name) {
  const auto path = DescriptorPath(dir_, name);

  std::unique_lock lock(mutex_);
  // A directory named like a descriptor is not one.
  if (!storage::disk::FileExists(path)) {
    throw util::NotFound("delete descriptor: not found: " + path.string());
  }
  try {
    storage::disk::RemoveFile(path);
  } catch (const util::NotFound&) {
    throw util::NotFound("delete descriptor: not found: " + path.string());
  }

  TORRENTFS_LOG_INFO("descriptor deleted", {StringField("path", path.string())});
}

// ------------------------------------------------------------
// Create
// ------------------------------------------------------------

CreateResult DescriptorStore::Create(const std::string& name, std::string_view bytes) {
  const auto path = DescriptorPath(dir_, name);

  std::unique_lock lock(mutex_);

  CreateResult result;
  if (!storage::disk::FileExists(path)) {
    if (bytes.empty()) {
      throw util::InvalidInput("create descriptor: refusing to write 0 bytes to " + path.string());
    }
    Write(path, bytes);
    result.created = true;
  }

  result.descriptor = Load(path);
  return result;
}

bool DescriptorStore::CreateFromDefinition(const DescriptorDefinition& definition, const AuxiliaryMetaInfo& auxiliary) {
  const auto path  = DescriptorPath(dir_, definition.name());
  const auto bytes = codec::Encode(definition, auxiliary, announce_list_);

  std::unique_lock lock(mutex_);

  if (storage::disk::FileExists(path)) {
    return false;
  }
  Write(path, bytes);
  return true;
}

// ------------------------------------------------------------
// Load
// ------------------------------------------------------------

Descriptor DescriptorStore::LoadByName(const std::string& name) const {
  const auto path = DescriptorPath(dir_, name);

  std::unique_lock lock(mutex_);
  return Load(path);
}

Descriptor DescriptorStore::LoadByPath(const std::filesystem::path& path) const {
  const auto canonical = CanonicalPath(path);

  std::unique_lock lock(mutex_);
  return Load(canonical);
}

// ------------------------------------------------------------
// Internals (caller holds mutex_)
// ------------------------------------------------------------

void DescriptorStore::Write(const std::filesystem::path& path, std::string_view bytes) {
  if (path.parent_path() != dir_) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw util::IoError("create directory " + path.parent_path().string() + ": " + ec.message());
    }
  }

  storage::disk::AtomicWrite(path, WrapBytes(bytes));

  TORRENTFS_LOG_INFO("descriptor created", {StringField("path", path.string()), IntField("size_bytes", static_cast<int64_t>(bytes.size()))});
}

Descriptor DescriptorStore::Load(const std::filesystem::path& path) const {
  std::shared_ptr<arrow::Buffer> buffer;
  try {
    buffer = storage::disk::ReadFile(path);
  } catch (const util::NotFound&) {
    throw util::NotFound("load descriptor: not found: " + path.string());
  }

  auto descriptor = codec::Decode(AsStringView(*buffer), path.string());
  codec::ApplyAnnounceList(descriptor, announce_list_);

  TORRENTFS_LOG_DEBUG("descriptor loaded",
                      {StringField("path", path.string()), StringField("info_hash", codec::InfoHash(descriptor)),
                       BoolField("has_trackers", !descriptor.trackers.empty())});
  return descriptor;
}

} // namespace torrentfs::store
