#include "sceneseek/service_runtime.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace sceneseek {
namespace {

std::unique_ptr<ThumbnailUrlProvider> MakeThumbnailProvider(const ServiceConfig& config) {
  if (config.thumbnail_base_url.empty()) {
    return nullptr;
  }
  return std::make_unique<StaticThumbnailUrlProvider>(config.thumbnail_base_url, config.thumbnail_expiry_seconds);
}

GenerationBackend& RequireBackend(const std::unique_ptr<GenerationBackend>& backend) {
  if (backend == nullptr) {
    throw std::invalid_argument("service runtime requires a generation backend");
  }
  return *backend;
}

}  // namespace

ServiceRuntime::ServiceRuntime(const ServiceConfig& config, std::unique_ptr<GenerationBackend> backend)
    : config_(config),
      catalog_(config.catalog_db),
      index_(CatalogIndex::Build(catalog_)),
      embedder_(config.embedding),
      retriever_(catalog_, index_),
      conversations_(config.conversation_db),
      thumbnails_(MakeThumbnailProvider(config)),
      backend_(std::move(backend)),
      chat_(RequireBackend(backend_), registry_, conversations_, thumbnails_.get(), config.agent) {
  RegisterCatalogTools(registry_, retriever_, embedder_, config.tools);
  spdlog::info("runtime ready: catalog={} files={} tools={} planner={}", config_.catalog_db, catalog_.TotalFiles(),
               registry_.size(), PlannerKindName(config_.planner.kind));
}

}  // namespace sceneseek
