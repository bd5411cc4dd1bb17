#include "torrent_codec.hpp"

#include <cstddef>
#include <ctime>
#include <iterator>
#include <sstream>

// Disable warnings raised during compilation of libtorrent
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-conversion"
#include <libtorrent/bencode.hpp>
#include <libtorrent/create_torrent.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/file_storage.hpp>
#include <libtorrent/load_torrent.hpp>
#include <libtorrent/torrent_info.hpp>
#pragma GCC diagnostic pop

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace torrentfs::codec {

using namespace torrentfs::v1;

namespace {

constexpr int64_t kMinPieceLength   = 16 * 1024;
constexpr int64_t kMaxPieceLength   = int64_t{1} << 30;
constexpr size_t  kPieceHashLength  = 20;
constexpr char    kDefaultCreator[] = "torrentfs";

bool IsPowerOfTwo(int64_t value) {
  return value > 0 && (value & (value - 1)) == 0;
}

void ValidatePathComponent(const std::string& component, const std::string& name) {
  if (!storage::common::IsValidComponent(component)) {
    throw util::InvalidInput("descriptor " + name + ": invalid file path component '" + component + "'");
  }
}

lt::file_storage BuildFileStorage(const DescriptorDefinition& definition) {
  lt::file_storage storage;

  if (definition.files().empty()) {
    if (definition.length() <= 0) {
      throw util::InvalidInput("descriptor " + definition.name() + ": single-file length must be positive");
    }
    storage.add_file(definition.name(), definition.length());
    return storage;
  }

  if (definition.length() != 0) {
    throw util::InvalidInput("descriptor " + definition.name() + ": length and files are mutually exclusive");
  }

  for (const auto& file : definition.files()) {
    if (file.path().empty()) {
      throw util::InvalidInput("descriptor " + definition.name() + ": file entry without path");
    }
    if (file.length() < 0) {
      throw util::InvalidInput("descriptor " + definition.name() + ": negative file length");
    }

    std::string path = definition.name();
    for (const auto& component : file.path()) {
      ValidatePathComponent(component, definition.name());
      path += "/" + component;
    }
    storage.add_file(path, file.length());
  }

  if (storage.total_size() <= 0) {
    throw util::InvalidInput("descriptor " + definition.name() + ": content is empty");
  }
  return storage;
}

} // namespace

AnnounceList ToAnnounceList(const google::protobuf::RepeatedPtrField<TrackerTier>& tiers) {
  AnnounceList result;
  result.reserve(static_cast<size_t>(tiers.size()));
  for (const auto& tier : tiers) {
    result.emplace_back(tier.urls().begin(), tier.urls().end());
  }
  return result;
}

std::string Encode(const DescriptorDefinition& definition, const AuxiliaryMetaInfo& auxiliary, const AnnounceList& announce_list) {
  // The info name is a single file or directory name, never a sub-path.
  if (!storage::common::IsValidComponent(definition.name())) {
    throw util::InvalidInput("invalid descriptor name: '" + definition.name() + "'");
  }

  const int64_t piece_length = definition.piece_length();
  if (!IsPowerOfTwo(piece_length) || piece_length < kMinPieceLength || piece_length > kMaxPieceLength) {
    throw util::InvalidInput("descriptor " + definition.name() + ": piece length " + std::to_string(piece_length) +
                             " must be a power of two between 16 KiB and 1 GiB");
  }

  auto storage = BuildFileStorage(definition);

  try {
    lt::create_torrent torrent{storage, static_cast<int>(piece_length), lt::create_torrent::v1_only};

    if (definition.piece_hashes_size() != torrent.num_pieces()) {
      throw util::InvalidInput("descriptor " + definition.name() + ": expected " + std::to_string(torrent.num_pieces()) +
                               " piece hashes, got " + std::to_string(definition.piece_hashes_size()));
    }

    for (int i = 0; i < definition.piece_hashes_size(); ++i) {
      const auto& hash = definition.piece_hashes(i);
      if (hash.size() != kPieceHashLength) {
        throw util::InvalidInput("descriptor " + definition.name() + ": piece hash " + std::to_string(i) + " is not 20 bytes");
      }
      torrent.set_hash(lt::piece_index_t{i}, lt::sha1_hash{hash.data()});
    }

    torrent.set_creator(auxiliary.created_by().empty() ? kDefaultCreator : auxiliary.created_by().c_str());
    if (!auxiliary.comment().empty()) {
      torrent.set_comment(auxiliary.comment().c_str());
    }

    const int64_t creation_date =
        auxiliary.creation_date() > 0 ? auxiliary.creation_date() : util::ToUnixSeconds(util::Now());
    torrent.set_creation_date(static_cast<std::time_t>(creation_date));

    for (const auto& url : auxiliary.url_list()) {
      torrent.add_url_seed(url);
    }

    for (size_t tier = 0; tier < announce_list.size(); ++tier) {
      for (const auto& url : announce_list[tier]) {
        torrent.add_tracker(url, static_cast<int>(tier));
      }
    }

    std::string data;
    lt::bencode(std::back_inserter(data), torrent.generate());
    return data;
  } catch (const lt::system_error& e) {
    throw util::InvalidInput("descriptor " + definition.name() + ": " + e.what());
  }
}

Descriptor Decode(std::string_view bytes, const std::string& source) {
  try {
    return lt::load_torrent_buffer(lt::span<char const>{bytes.data(), static_cast<std::ptrdiff_t>(bytes.size())});
  } catch (const lt::system_error& e) {
    throw util::DecodeError("decode " + source + ": " + e.what());
  }
}

void ApplyAnnounceList(Descriptor& descriptor, const AnnounceList& announce_list) {
  if (descriptor.ti) {
    descriptor.ti->clear_trackers();
  }

  descriptor.trackers.clear();
  descriptor.tracker_tiers.clear();
  for (size_t tier = 0; tier < announce_list.size(); ++tier) {
    for (const auto& url : announce_list[tier]) {
      descriptor.trackers.push_back(url);
      descriptor.tracker_tiers.push_back(static_cast<int>(tier));
    }
  }
}

std::string InfoHash(const Descriptor& descriptor) {
  if (!descriptor.ti) {
    return {};
  }
  std::stringstream stream;
  stream << descriptor.ti->info_hashes().get_best();
  return stream.str();
}

} // namespace torrentfs::codec
