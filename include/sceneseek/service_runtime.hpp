#pragma once

#include "sceneseek/catalog_store.hpp"
#include "sceneseek/chat_service.hpp"
#include "sceneseek/config.hpp"
#include "sceneseek/conversation_store.hpp"
#include "sceneseek/embeddings.hpp"
#include "sceneseek/generation.hpp"
#include "sceneseek/retrieval.hpp"
#include "sceneseek/thumbnails.hpp"
#include "sceneseek/tool_registry.hpp"
#include "sceneseek/vector_index.hpp"

#include <memory>

namespace sceneseek {

// Owns the process-wide pieces behind ChatService: catalog, index, embedder,
// tool registry, conversation log and the generation backend. The catalog
// index is built once here and never mutated while serving.
class ServiceRuntime {
 public:
  ServiceRuntime(const ServiceConfig& config, std::unique_ptr<GenerationBackend> backend);

  ServiceRuntime(const ServiceRuntime&) = delete;
  ServiceRuntime& operator=(const ServiceRuntime&) = delete;

  [[nodiscard]] const ServiceConfig& config() const { return config_; }
  [[nodiscard]] const CatalogStore& catalog() const { return catalog_; }
  [[nodiscard]] const ToolRegistry& tools() const { return registry_; }
  ConversationStore& conversations() { return conversations_; }
  ChatService& chat() { return chat_; }

 private:
  ServiceConfig config_;
  CatalogStore catalog_;
  CatalogIndex index_;
  HashingEmbeddingProvider embedder_;
  Retriever retriever_;
  ToolRegistry registry_;
  SqliteConversationStore conversations_;
  std::unique_ptr<ThumbnailUrlProvider> thumbnails_;
  std::unique_ptr<GenerationBackend> backend_;
  ChatService chat_;
};

}  // namespace sceneseek
