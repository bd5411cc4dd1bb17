#pragma once

#include <google/protobuf/repeated_ptr_field.h>

#include <string>
#include <string_view>
#include <vector>

#include "torrentfs/v1.hpp"

namespace torrentfs::codec {

/*
  Bencoded metainfo codec backed by libtorrent.

  The store treats descriptor bytes as opaque; everything that knows the
  metainfo layout lives here.
*/

// Announce tiers, outer index is the tier.
using AnnounceList = std::vector<std::vector<std::string>>;

AnnounceList ToAnnounceList(const google::protobuf::RepeatedPtrField<torrentfs::v1::TrackerTier>& tiers);

/*
  Build a v1 metainfo file.

  Throws util::InvalidInput when the definition is inconsistent:
  bad piece length, piece hash count not matching the content size,
  hashes that are not 20 bytes, empty or path-like names.
*/
std::string Encode(const torrentfs::v1::DescriptorDefinition& definition, const torrentfs::v1::AuxiliaryMetaInfo& auxiliary,
                   const AnnounceList& announce_list);

// Throws util::DecodeError. source is only used in the message.
torrentfs::v1::Descriptor Decode(std::string_view bytes, const std::string& source);

// Replaces whatever announce list the file carried.
void ApplyAnnounceList(torrentfs::v1::Descriptor& descriptor, const AnnounceList& announce_list);

// Hex info-hash (v1 SHA-1 when present).
std::string InfoHash(const torrentfs::v1::Descriptor& descriptor);

} // namespace torrentfs::codec
