#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/store/admission_gate.hpp"
#include "internal/store/descriptor_store.hpp"

namespace torrentfs::factory {

/*
  Application

  Owns the store objects bound to the configured directory.
  Both share the directory; each serializes its own file operations.
*/
struct Application {
  std::shared_ptr<store::DescriptorStore> descriptors;
  std::shared_ptr<store::AdmissionGate>   admission;
};

/*
  Build

  Composition root: the only place that turns RuntimeConfig into objects.
*/
Application Build(const torrentfs::runtime::config::RuntimeConfig& config);

} // namespace torrentfs::factory
