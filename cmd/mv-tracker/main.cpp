#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/config/credentials.hpp"
#include "internal/core/search_schedule.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using mvtracker::core::SearchMode;
using mvtracker::observability::IntField;
using mvtracker::observability::StringField;

static void Usage() {
  std::cerr << "Usage: mv-tracker [--search | --cache-only] <config.yaml>\n"
            << "       mv-tracker [--search | --cache-only] --config <config.yaml>\n"
            << "\n"
            << "Environment: YOUTUBE_API_KEY, MACKEREL_API_KEY (required)\n";
}

int main(int argc, char** argv) {
  std::string config_path;
  SearchMode  mode = SearchMode::kSchedule;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--search") {
      mode = SearchMode::kForceSearch;
    } else if (arg == "--cache-only") {
      mode = SearchMode::kCacheOnly;
    } else if (arg == "-h" || arg == "--help") {
      Usage();
      return 0;
    } else if (!arg.empty() && arg[0] != '-' && config_path.empty()) {
      config_path = arg;
    } else {
      Usage();
      return 1;
    }
  }

  if (config_path.empty()) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration and credentials
    // ------------------------------------------------------------
    auto config = mvtracker::config::ConfigLoader::LoadFromYaml(config_path);
    mvtracker::observability::InitializeLogging(config.logging());

    const auto credentials = mvtracker::config::LoadCredentialsFromEnv();

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = mvtracker::factory::Build(config, credentials);

    const auto now        = mvtracker::util::Now();
    const bool search_run = mvtracker::core::IsSearchRun(config.schedule(), now, mode);
    MVTRACKER_LOG_INFO(search_run ? "Search run: resolving latest MVs" : "Cache run: reporting on cached MVs",
                       {IntField("local_hour", mvtracker::util::HourAtOffset(now, config.schedule().utc_offset_hours())),
                        IntField("utc_offset_hours", config.schedule().utc_offset_hours())});

    // ------------------------------------------------------------
    // Run
    // ------------------------------------------------------------
    const auto report = app.orchestrator->Run(search_run);
    mvtracker::core::LogReport(report);

    mvtracker::observability::ShutdownLogging();
  } catch (const mvtracker::util::ConfigError& e) {
    MVTRACKER_LOG_ERROR("Configuration error", {StringField("error", e.what())});
    mvtracker::observability::ShutdownLogging();
    return 2;
  } catch (const std::exception& e) {
    MVTRACKER_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    mvtracker::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
