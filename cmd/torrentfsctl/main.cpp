#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "internal/codec/torrent_codec.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/disk/atomic_file.hpp"
#include "internal/util/errors.hpp"

using torrentfs::factory::Application;
using torrentfs::observability::StringField;

static void Usage() {
  std::cout << "Usage:\n"
            << "  torrentfsctl --config <config.yaml> exists <name>\n"
            << "  torrentfsctl --config <config.yaml> create <name> <metainfo-file>\n"
            << "  torrentfsctl --config <config.yaml> load <name>\n"
            << "  torrentfsctl --config <config.yaml> delete <name>\n"
            << "  torrentfsctl --config <config.yaml> prohibit [--add <pattern>]... [--remove <pattern>]...\n"
            << "  torrentfsctl --config <config.yaml> prohibited <name>\n"
            << "  torrentfsctl --config <config.yaml> whitelist\n";
}

static void PrintWhitelist(const std::vector<std::string>& whitelist) {
  std::cout << "whitelist (" << whitelist.size() << "):\n";
  for (const auto& pattern : whitelist) {
    std::cout << "  " << pattern << "\n";
  }
}

static void PrintDescriptor(const torrentfs::v1::Descriptor& descriptor) {
  std::cout << "name=" << (descriptor.ti ? descriptor.ti->name() : descriptor.name) << "\n"
            << "info_hash=" << torrentfs::codec::InfoHash(descriptor) << "\n";
  if (descriptor.ti) {
    std::cout << "pieces=" << descriptor.ti->num_pieces() << "\n"
              << "total_size=" << descriptor.ti->total_size() << "\n";
  }
  for (size_t i = 0; i < descriptor.trackers.size(); ++i) {
    const int tier = i < descriptor.tracker_tiers.size() ? descriptor.tracker_tiers[i] : 0;
    std::cout << "tracker[" << tier << "]=" << descriptor.trackers[i] << "\n";
  }
}

static int Run(const Application& app, const std::string& cmd, const std::vector<std::string>& args) {
  if (cmd == "exists" && args.size() == 1) {
    std::cout << "exists=" << (app.descriptors->Exists(args[0]) ? "true" : "false") << "\n";
    return 0;
  }

  if (cmd == "create" && args.size() == 2) {
    auto bytes  = torrentfs::storage::disk::ReadFile(args[1]);
    auto result = app.descriptors->Create(args[0], torrentfs::storage::common::AsStringView(*bytes));
    std::cout << "created=" << (result.created ? "true" : "false") << " info_hash=" << torrentfs::codec::InfoHash(result.descriptor) << "\n";
    return 0;
  }

  if (cmd == "load" && args.size() == 1) {
    PrintDescriptor(app.descriptors->LoadByName(args[0]));
    return 0;
  }

  if (cmd == "delete" && args.size() == 1) {
    app.descriptors->Delete(args[0]);
    std::cout << "deleted " << args[0] << "\n";
    return 0;
  }

  if (cmd == "prohibit") {
    std::vector<std::string> add;
    std::vector<std::string> remove;
    for (size_t i = 0; i < args.size(); i += 2) {
      if (i + 1 >= args.size()) {
        Usage();
        return 1;
      }
      if (args[i] == "--add") {
        add.push_back(args[i + 1]);
      } else if (args[i] == "--remove") {
        remove.push_back(args[i + 1]);
      } else {
        Usage();
        return 1;
      }
    }
    PrintWhitelist(app.admission->ProhibitNewDownloads(add, remove));
    return 0;
  }

  if (cmd == "prohibited" && args.size() == 1) {
    std::cout << "prohibited=" << (app.admission->NewDownloadsAreProhibited(args[0]) ? "true" : "false") << "\n";
    return 0;
  }

  if (cmd == "whitelist" && args.empty()) {
    auto whitelist = app.admission->Whitelist();
    if (!whitelist) {
      std::cout << "unrestricted\n";
    } else {
      PrintWhitelist(*whitelist);
    }
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string              config_path = argv[2];
  const std::string              cmd         = argv[3];
  const std::vector<std::string> args(argv + 4, argv + argc);

  try {
    auto config = torrentfs::config::ConfigLoader::LoadFromYaml(config_path);
    torrentfs::observability::InitializeLogging(config);

    auto app  = torrentfs::factory::Build(config);
    int  code = Run(app, cmd, args);

    torrentfs::observability::ShutdownLogging();
    return code;
  } catch (const torrentfs::util::WhitelistWriteError& e) {
    TORRENTFS_LOG_ERROR("whitelist not written", {StringField("error", e.what())});
    PrintWhitelist(e.whitelist());
  } catch (const std::exception& e) {
    TORRENTFS_LOG_ERROR("command failed", {StringField("command", cmd), StringField("error", e.what())});
  }

  torrentfs::observability::ShutdownLogging();
  return 2;
}
