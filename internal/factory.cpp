#include "factory.hpp"

#include "internal/codec/torrent_codec.hpp"
#include "internal/observability/logging.hpp"

namespace torrentfs::factory {

using torrentfs::observability::IntField;
using torrentfs::observability::StringField;

Application Build(const torrentfs::runtime::config::RuntimeConfig& config) {
  const std::filesystem::path dir = config.store().dir();

  Application app;
  app.descriptors = std::make_shared<store::DescriptorStore>(dir, codec::ToAnnounceList(config.trackers()));
  app.admission   = std::make_shared<store::AdmissionGate>(dir);

  TORRENTFS_LOG_DEBUG("store opened", {StringField("dir", dir.string()), IntField("tracker_tiers", config.trackers_size())});
  return app;
}

} // namespace torrentfs::factory
