#include "factory.hpp"

#include <chrono>
#include <memory>

#include "internal/catalog/youtube_catalog.hpp"
#include "internal/http/curl_http_client.hpp"
#include "internal/resolver/mv_resolver.hpp"
#include "internal/resolver/title_rules.hpp"
#include "internal/sink/mackerel_sink.hpp"
#include "internal/state/json_file_state_store.hpp"
#include "internal/state/sqlite_state_store.hpp"
#include "internal/util/errors.hpp"

namespace mvtracker::factory {

using mvtracker::runtime::config::RuntimeConfig;

core::RunSettings ToRunSettings(const RuntimeConfig& config) {
  core::RunSettings settings;
  settings.metric_namespace = config.sink().metric_namespace();
  settings.save_each_group  = config.state().save_each_group();
  for (const auto& group : config.groups()) {
    settings.groups.push_back({group.id(), group.name(), group.channel_id()});
  }
  return settings;
}

std::shared_ptr<state::StateStore> BuildStateStore(const mvtracker::runtime::config::StateConfig& config) {
  if (config.backend() == "sqlite") {
    return std::make_shared<state::SqliteStateStore>(config.path());
  }
  if (config.backend() == "json") {
    return std::make_shared<state::JsonFileStateStore>(config.path());
  }
  throw util::ConfigError("unknown state backend '" + config.backend() + "'");
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config, const config::Credentials& credentials) {
  Application app;

  // ------------------------------------------------------------------
  // Transports
  // ------------------------------------------------------------------
  auto catalog_http = std::make_shared<http::CurlHttpClient>(std::chrono::seconds(config.catalog().timeout_seconds()));
  auto sink_http    = std::make_shared<http::CurlHttpClient>(std::chrono::seconds(config.sink().timeout_seconds()));

  // ------------------------------------------------------------------
  // Catalog + resolver
  // ------------------------------------------------------------------
  catalog::YouTubeCatalogOptions catalog_options;
  catalog_options.base_url    = config.catalog().base_url();
  catalog_options.api_key     = credentials.catalog_api_key;
  catalog_options.max_results = config.catalog().max_results();
  auto video_catalog          = std::make_shared<catalog::YouTubeCatalog>(std::move(catalog_options), catalog_http);

  auto resolver = std::make_shared<resolver::MvResolver>(video_catalog, resolver::TitleRules::FromConfig(config.resolver()),
                                                         std::chrono::seconds(config.resolver().min_duration_seconds()));

  // ------------------------------------------------------------------
  // Sink + state
  // ------------------------------------------------------------------
  sink::MackerelSinkOptions sink_options;
  sink_options.base_url     = config.sink().base_url();
  sink_options.service_name = config.sink().service_name();
  sink_options.api_key      = credentials.sink_api_key;
  auto metric_sink          = std::make_shared<sink::MackerelSink>(std::move(sink_options), sink_http);

  auto store = BuildStateStore(config.state());

  app.orchestrator = std::make_shared<core::RunOrchestrator>(ToRunSettings(config), std::move(resolver), std::move(video_catalog),
                                                             std::move(store), std::move(metric_sink));
  return app;
}

} // namespace mvtracker::factory
