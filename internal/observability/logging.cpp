#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace torrentfs::observability {
namespace {

std::string ResolveLevel(const torrentfs::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("TORRENTFS_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const torrentfs::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("TORRENTFS_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string ResolveFile(const torrentfs::runtime::config::RuntimeConfig& config) {
  if (const char* file = std::getenv("TORRENTFS_LOG_FILE")) {
    return file;
  }
  return config.logging().file();
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

/*
  stderr keeps stdout free for torrentfsctl output. When a log file is
  configured every record is also appended there, so descriptor and
  whitelist changes made by separate torrentfsctl runs end up in one place.
*/
void InitializeLogging(const torrentfs::runtime::config::RuntimeConfig& config) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  const auto file = ResolveFile(config);
  if (!file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file));
  }

  auto logger = std::make_shared<spdlog::logger>("torrentfs", sinks.begin(), sinks.end());
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(file.empty() ? spdlog::level::warn : spdlog::level::info);

  LogDebug("logging initialized",
           {StringField("store_dir", config.store().dir()), IntField("tracker_tiers", config.trackers_size()),
            StringField("log_file", file)});
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace torrentfs::observability
