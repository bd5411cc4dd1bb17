#include "internal/store/descriptor_store.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include <libtorrent/torrent_info.hpp>

#include "internal/codec/torrent_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using torrentfs::codec::AnnounceList;
using torrentfs::codec::InfoHash;
using torrentfs::store::DescriptorStore;
using torrentfs::v1::AuxiliaryMetaInfo;
using torrentfs::v1::DescriptorDefinition;

const AnnounceList kTrackers = {{"udp://tracker.example.org:6969/announce"}, {"http://backup.example.org/announce"}};

std::filesystem::path FreshDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "torrentfs_descriptor_store_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

DescriptorDefinition MakeDefinition(const std::string& name, int pieces = 2) {
  DescriptorDefinition definition;
  definition.set_name(name);
  definition.set_piece_length(16 * 1024);
  definition.set_length(int64_t{16 * 1024} * pieces);
  for (int i = 0; i < pieces; ++i) {
    definition.add_piece_hashes(std::string(20, static_cast<char>('a' + i)));
  }
  return definition;
}

std::string MakeMetainfo(const std::string& name, const AnnounceList& stored_trackers = {}) {
  AuxiliaryMetaInfo auxiliary;
  auxiliary.set_creation_date(1700000000);
  return torrentfs::codec::Encode(MakeDefinition(name), auxiliary, stored_trackers);
}

void WriteRaw(const std::filesystem::path& path, const std::string& bytes) {
  std::ofstream out(path, std::ios::binary);
  out << bytes;
}

std::string ReadRaw(const std::filesystem::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

template <typename Error, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const Error&) {
    threw = true;
  }
  assert(threw);
}

void TestCreateThenLoadRoundTrips() {
  const auto      dir = FreshDir("round_trip");
  DescriptorStore store(dir, kTrackers);

  AuxiliaryMetaInfo auxiliary;
  auxiliary.set_created_by("erigon/2.60");
  auxiliary.set_comment("headers 0-500k");
  auxiliary.set_creation_date(1700000000);
  const auto bytes = torrentfs::codec::Encode(MakeDefinition("a.seg"), auxiliary, {});

  auto result = store.Create("a.seg", bytes);

  assert(result.created);
  assert(ReadRaw(dir / "a.seg.torrent") == bytes);
  assert(InfoHash(result.descriptor) == InfoHash(torrentfs::codec::Decode(bytes, "expected")));

  const auto loaded = store.LoadByName("a.seg");
  assert(InfoHash(loaded) == InfoHash(result.descriptor));
  assert(loaded.ti->name() == "a.seg");
  assert(loaded.ti->creator() == "erigon/2.60");
  assert(loaded.ti->comment() == "headers 0-500k");
  assert(loaded.ti->creation_date() == 1700000000);

  // Loading never rewrites the file.
  assert(ReadRaw(dir / "a.seg.torrent") == bytes);
}

void TestSecondCreateReportsNotCreated() {
  const auto      dir = FreshDir("idempotent");
  DescriptorStore store(dir, kTrackers);

  const auto first_bytes = MakeMetainfo("a.seg");
  assert(store.Create("a.seg", first_bytes).created);

  // A different payload for the same name is ignored; the stored file wins.
  auto second = store.Create("a.seg.torrent", MakeMetainfo("other.seg"));
  assert(!second.created);
  assert(second.descriptor.ti->name() == "a.seg");

  // Existing descriptor is returned even for an empty payload.
  auto third = store.Create("a.seg", "");
  assert(!third.created);
}

void TestEmptyPayloadIsRejected() {
  const auto      dir = FreshDir("empty_payload");
  DescriptorStore store(dir, kTrackers);

  ExpectThrows<torrentfs::util::InvalidInput>([&] { (void)store.Create("a.seg", ""); });

  assert(!store.Exists("a.seg"));
  assert(std::filesystem::is_empty(dir));
}

void TestCanonicalNameIsUsedEverywhere() {
  const auto      dir = FreshDir("canonical");
  DescriptorStore store(dir, kTrackers);

  (void)store.Create("a.seg", MakeMetainfo("a.seg"));

  assert(store.Exists("a.seg"));
  assert(store.Exists("a.seg.torrent"));
  assert(InfoHash(store.LoadByName("a.seg")) == InfoHash(store.LoadByName("a.seg.torrent")));
  assert(InfoHash(store.LoadByPath(dir / "a.seg")) == InfoHash(store.LoadByPath(dir / "a.seg.torrent")));
  assert(!std::filesystem::exists(dir / "a.seg.torrent.torrent"));
}

void TestDeleteThenDeleteAgain() {
  const auto      dir = FreshDir("delete");
  DescriptorStore store(dir, kTrackers);

  (void)store.Create("a.seg", MakeMetainfo("a.seg"));
  store.Delete("a.seg");

  assert(!store.Exists("a.seg"));
  ExpectThrows<torrentfs::util::NotFound>([&] { store.Delete("a.seg"); });
  ExpectThrows<torrentfs::util::NotFound>([&] { (void)store.LoadByName("a.seg"); });
}

void TestLoadOverridesStoredTrackers() {
  const auto      dir = FreshDir("trackers");
  DescriptorStore store(dir, kTrackers);

  (void)store.Create("a.seg", MakeMetainfo("a.seg", {{"udp://stale.example.org:1/announce"}}));
  const auto loaded = store.LoadByName("a.seg");

  assert(loaded.trackers.size() == 2);
  assert(loaded.trackers[0] == "udp://tracker.example.org:6969/announce");
  assert(loaded.trackers[1] == "http://backup.example.org/announce");
  assert(loaded.tracker_tiers[0] == 0);
  assert(loaded.tracker_tiers[1] == 1);
  assert(loaded.ti->trackers().empty());
}

void TestCorruptFileReportsDecodeError() {
  const auto      dir = FreshDir("corrupt");
  DescriptorStore store(dir, kTrackers);

  WriteRaw(dir / "bad.seg.torrent", "this is not bencode");

  assert(store.Exists("bad.seg"));
  ExpectThrows<torrentfs::util::DecodeError>([&] { (void)store.LoadByName("bad.seg"); });
  ExpectThrows<torrentfs::util::DecodeError>([&] { (void)store.Create("bad.seg", MakeMetainfo("bad.seg")); });
}

void TestStrayTempFileIsIgnored() {
  const auto      dir = FreshDir("stray_tmp");
  DescriptorStore store(dir, kTrackers);

  // Left behind by a crash between write and rename.
  WriteRaw(dir / "a.seg.torrent.tmp", "partial");

  assert(!store.Exists("a.seg"));
  ExpectThrows<torrentfs::util::NotFound>([&] { (void)store.LoadByName("a.seg"); });

  auto result = store.Create("a.seg", MakeMetainfo("a.seg"));
  assert(result.created);
  assert(!std::filesystem::exists(dir / "a.seg.torrent.tmp"));
  assert(result.descriptor.ti->name() == "a.seg");
}

void TestCreateFromDefinition() {
  const auto      dir = FreshDir("definition");
  DescriptorStore store(dir, kTrackers);

  AuxiliaryMetaInfo auxiliary;
  auxiliary.set_comment("snapshot");

  assert(store.CreateFromDefinition(MakeDefinition("b.seg"), auxiliary));
  assert(store.Exists("b.seg"));
  assert(!store.CreateFromDefinition(MakeDefinition("b.seg", 3), auxiliary));

  const auto loaded = store.LoadByName("b.seg");
  assert(loaded.ti->num_pieces() == 2);
  assert(loaded.ti->comment() == "snapshot");
  assert(loaded.ti->creator() == "torrentfs");
  assert(loaded.ti->creation_date() > 0);
  assert(loaded.trackers.size() == 2);

  ExpectThrows<torrentfs::util::InvalidInput>([&] {
    auto definition = MakeDefinition("c.seg");
    definition.set_piece_length(3);
    (void)store.CreateFromDefinition(definition, auxiliary);
  });
  assert(!store.Exists("c.seg"));
}

void TestInvalidNames() {
  const auto      dir = FreshDir("invalid_names");
  DescriptorStore store(dir, kTrackers);

  assert(!store.Exists(""));
  assert(!store.Exists("../etc/passwd"));
  assert(!store.Exists("/etc/passwd"));
  ExpectThrows<torrentfs::util::InvalidInput>([&] { (void)store.Create("../escape", MakeMetainfo("escape")); });
  ExpectThrows<torrentfs::util::InvalidInput>([&] { store.Delete("sub/../../a.seg"); });
  ExpectThrows<torrentfs::util::InvalidInput>([&] { (void)store.LoadByName(""); });
  ExpectThrows<torrentfs::util::NotFound>([&] { store.Delete("sub/a.seg"); });
  assert(!std::filesystem::exists(dir.parent_path() / "escape.torrent"));
}

void TestSubdirectoryNames() {
  const auto      dir = FreshDir("subdirectory");
  DescriptorStore store(dir, kTrackers);

  const auto bytes  = MakeMetainfo("v1-accounts.0-32.v");
  auto       result = store.Create("history/v1-accounts.0-32.v", bytes);

  assert(result.created);
  assert(ReadRaw(dir / "history" / "v1-accounts.0-32.v.torrent") == bytes);
  assert(store.Exists("history/v1-accounts.0-32.v"));
  assert(store.Exists("history/v1-accounts.0-32.v.torrent"));
  assert(!store.Exists("v1-accounts.0-32.v"));
  assert(store.LoadByName("history/v1-accounts.0-32.v").ti->name() == "v1-accounts.0-32.v");

  assert(!store.Create("history/v1-accounts.0-32.v", MakeMetainfo("other.v")).created);

  store.Delete("history/v1-accounts.0-32.v");
  assert(!store.Exists("history/v1-accounts.0-32.v"));
  assert(!std::filesystem::exists(dir / "history" / "v1-accounts.0-32.v.torrent.tmp"));
}

void TestDirectoryIsNotADescriptor() {
  const auto      dir = FreshDir("directory_named_like_descriptor");
  DescriptorStore store(dir, kTrackers);

  std::filesystem::create_directories(dir / "x.torrent");

  assert(!store.Exists("x"));
  ExpectThrows<torrentfs::util::NotFound>([&] { store.Delete("x"); });
  ExpectThrows<torrentfs::util::NotFound>([&] { store.Delete("x.torrent"); });
  assert(std::filesystem::is_directory(dir / "x.torrent"));
}

void TestStoreCreatesDirectory() {
  const auto dir = FreshDir("mkdir") / "nested" / "snapshots";
  assert(!std::filesystem::exists(dir));

  DescriptorStore store(dir, {});
  assert(std::filesystem::is_directory(dir));
  assert(store.Dir() == dir);
}

} // namespace

int main() {
  TestCreateThenLoadRoundTrips();
  TestSecondCreateReportsNotCreated();
  TestEmptyPayloadIsRejected();
  TestCanonicalNameIsUsedEverywhere();
  TestDeleteThenDeleteAgain();
  TestLoadOverridesStoredTrackers();
  TestCorruptFileReportsDecodeError();
  TestStrayTempFileIsIgnored();
  TestCreateFromDefinition();
  TestInvalidNames();
  TestSubdirectoryNames();
  TestDirectoryIsNotADescriptor();
  TestStoreCreatesDirectory();

  std::cout << "torrentfs_unit_descriptor_store: pass\n";
  return 0;
}
