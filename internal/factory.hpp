#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/config/credentials.hpp"
#include "internal/core/run_orchestrator.hpp"

namespace mvtracker::state {
class StateStore;
}

namespace mvtracker::factory {

/*
  Application

  Owns everything a run needs. Lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<core::RunOrchestrator> orchestrator;
};

/*
  Build

  Composition root: the only place that knows the concrete catalog, sink
  and state store types.
*/
Application Build(const mvtracker::runtime::config::RuntimeConfig& config, const config::Credentials& credentials);

core::RunSettings ToRunSettings(const mvtracker::runtime::config::RuntimeConfig& config);

std::shared_ptr<state::StateStore> BuildStateStore(const mvtracker::runtime::config::StateConfig& config);

} // namespace mvtracker::factory
