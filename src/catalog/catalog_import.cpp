#include "sceneseek/catalog_import.hpp"

#include "sceneseek/catalog_store.hpp"
#include "sceneseek/embeddings.hpp"
#include "sceneseek/errors.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace sceneseek {
namespace {

std::string DescribeForEmbedding(const CatalogFile& file) {
  std::string text = file.name;
  text.push_back(' ');
  text.append(file.path);
  if (file.show.has_value()) {
    text.push_back(' ');
    text.append(*file.show);
  }
  text.push_back(' ');
  text.append(FileTypeName(file.type));
  return text;
}

template <typename Info>
void FillVisual(Info& info, const CatalogFile& file, EmbeddingProvider& embedder) {
  if (info.visual_embedding.has_value() || file.error.has_value()) {
    return;
  }
  try {
    info.visual_embedding = embedder.EmbedTextForVisualSpace(DescribeForEmbedding(file));
  } catch (const EmbeddingFailure& e) {
    spdlog::warn("visual embedding skipped for file {}: {}", file.id, e.what());
  }
}

}  // namespace

std::vector<CatalogRecord> ParseCatalogDocument(const Json& document) {
  const Json* entries = &document;
  if (document.is_object()) {
    const auto it = document.find("files");
    if (it == document.end()) {
      throw std::invalid_argument("catalog document requires a 'files' array");
    }
    entries = &*it;
  }
  if (!entries->is_array()) {
    throw std::invalid_argument("catalog 'files' must be an array");
  }

  std::vector<CatalogRecord> records{};
  records.reserve(entries->size());
  for (const auto& entry : *entries) {
    CatalogRecord record{};
    record.file = FileFromJson(entry);
    const auto ext = entry.find("extension_info");
    if (ext != entry.end() && !ext->is_null()) {
      record.extension = ExtensionFromJson(*ext);
    }
    records.push_back(std::move(record));
  }
  return records;
}

void FillMissingEmbeddings(std::vector<CatalogRecord>& records, EmbeddingProvider& embedder) {
  for (auto& record : records) {
    auto& file = record.file;
    if (!file.embedding.has_value() && !file.error.has_value()) {
      try {
        file.embedding = embedder.EmbedText(DescribeForEmbedding(file));
      } catch (const EmbeddingFailure& e) {
        file.error = e.what();
      }
    }
    if (!record.extension.has_value()) {
      continue;
    }
    if (auto* image = std::get_if<ImageInfo>(&*record.extension)) {
      FillVisual(*image, file, embedder);
    } else if (auto* video = std::get_if<VideoInfo>(&*record.extension)) {
      FillVisual(*video, file, embedder);
    } else if (auto* blend = std::get_if<BlendInfo>(&*record.extension)) {
      FillVisual(*blend, file, embedder);
    }
  }
}

std::size_t ImportCatalog(CatalogStore& store, const Json& document, EmbeddingProvider* embedder) {
  auto records = ParseCatalogDocument(document);
  if (embedder != nullptr) {
    FillMissingEmbeddings(records, *embedder);
  }
  store.Import(records);
  return records.size();
}

}  // namespace sceneseek
