#pragma once

#include "conductor/common/result.hpp"
#include "conductor/config/schema.hpp"
#include "conductor/providers/traits.hpp"
#include "conductor/session/orchestrator.hpp"

#include <memory>

namespace conductor::session {

/// Wire every component from configuration: embedder, SQLite vector store on
/// a worker pool, retrievers (indexed when empty), provider-backed classifier,
/// router, resolver and session cache. A provider that cannot be built leaves
/// the router running on its cache alone.
[[nodiscard]] common::Result<std::unique_ptr<Orchestrator>>
build_orchestrator(const config::Config &config,
                   std::shared_ptr<providers::HttpClient> http_client =
                       std::make_shared<providers::CurlHttpClient>());

} // namespace conductor::session
