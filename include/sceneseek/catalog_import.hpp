#pragma once

#include "sceneseek/types.hpp"

#include <cstddef>
#include <vector>

namespace sceneseek {

class CatalogStore;
class EmbeddingProvider;

// Parses `{"files": [...]}` (or a bare array) of file objects, each with an
// optional nested "extension_info" object.
std::vector<CatalogRecord> ParseCatalogDocument(const Json& document);

// Fills missing text and visual embeddings from the provider. A file whose
// text cannot be embedded keeps no embedding and records the failure as its
// error. Files that carry an error get no visual embedding either.
void FillMissingEmbeddings(std::vector<CatalogRecord>& records, EmbeddingProvider& embedder);

// Parse, optionally enrich, then import transactionally. Returns file count.
std::size_t ImportCatalog(CatalogStore& store, const Json& document, EmbeddingProvider* embedder);

}  // namespace sceneseek
