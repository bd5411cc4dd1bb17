#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>

#include "internal/codec/torrent_codec.hpp"
#include "torrentfs/v1.hpp"

namespace torrentfs::store {

struct CreateResult {
  torrentfs::v1::Descriptor descriptor;

  // True only for the call that wrote the file.
  bool created = false;
};

/*
  Thread-safe CRUD over <dir>/<name>.torrent files.

  Properties:
    - every operation holds one instance-wide mutex
    - writes are atomic replace (tmp + fsync + rename)
    - creation is idempotent; racing creators get created=false, never an error
    - loaded descriptors always carry the configured announce list

  Names gain the ".torrent" extension when missing. Stray "*.tmp" files from
  an interrupted write are never read.
*/
class DescriptorStore {
 public:
  DescriptorStore(std::filesystem::path dir, codec::AnnounceList announce_list);

  // Never throws. Invalid names and stat errors read as "absent".
  bool Exists(const std::string& name) const;

  // Throws util::NotFound if absent, util::IoError on removal failure.
  void Delete(const std::string& name);

  /*
    Write bytes as <name>.torrent unless it already exists, then load it.

    Throws util::InvalidInput when a write is needed and bytes is empty,
    util::DecodeError when the stored bytes are not metainfo.
  */
  CreateResult Create(const std::string& name, std::string_view bytes);

  // Returns false without writing when definition.name() already has a file.
  bool CreateFromDefinition(const torrentfs::v1::DescriptorDefinition& definition, const torrentfs::v1::AuxiliaryMetaInfo& auxiliary);

  torrentfs::v1::Descriptor LoadByName(const std::string& name) const;
  torrentfs::v1::Descriptor LoadByPath(const std::filesystem::path& path) const;

  const std::filesystem::path& Dir() const {
    return dir_;
  }

 private:
  void                      Write(const std::filesystem::path& path, std::string_view bytes);
  torrentfs::v1::Descriptor Load(const std::filesystem::path& path) const;

  std::filesystem::path dir_;
  codec::AnnounceList   announce_list_;

  mutable std::mutex mutex_;
};

} // namespace torrentfs::store
