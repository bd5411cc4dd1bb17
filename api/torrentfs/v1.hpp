#pragma once

#include "config/config.pb.h"
#include "torrentfs/v1/descriptor.pb.h"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsign-conversion"
#include <libtorrent/add_torrent_params.hpp>
#pragma GCC diagnostic pop

namespace torrentfs::v1 {

/*
  Parsed descriptor as handed to the transfer engine.

  ti holds the decoded metainfo; trackers / tracker_tiers always carry the
  process-wide announce list, never the one stored in the file.
*/
using Descriptor = lt::add_torrent_params;

using ::torrentfs::runtime::config::TrackerTier;

} // namespace torrentfs::v1
