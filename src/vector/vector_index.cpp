#include "sceneseek/vector_index.hpp"

#include "sceneseek/catalog_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sceneseek {
namespace {

float Dot(std::span<const float> lhs, std::span<const float> rhs) {
  float dot = 0.0F;
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    dot += lhs[i] * rhs[i];
  }
  return dot;
}

float Norm(std::span<const float> v) {
  const auto dot = Dot(v, v);
  return std::sqrt(std::max(dot, 0.0F));
}

float CosineSimilarity(std::span<const float> lhs, std::span<const float> rhs) {
  const auto lhs_norm = Norm(lhs);
  const auto rhs_norm = Norm(rhs);
  if (lhs_norm <= 0.0F || rhs_norm <= 0.0F) {
    return 0.0F;
  }
  return Dot(lhs, rhs) / (lhs_norm * rhs_norm);
}

std::string DimensionMismatch(std::size_t expected, std::size_t actual) {
  return "vector dimension mismatch: expected " + std::to_string(expected) + ", got " + std::to_string(actual);
}

}  // namespace

FlatVectorIndex::FlatVectorIndex(std::size_t dimensions) : dimensions_(dimensions) {
  if (dimensions_ == 0) {
    throw std::invalid_argument("vector index dimensions must be > 0");
  }
}

void FlatVectorIndex::Add(std::int64_t id, std::vector<float> vector) {
  if (vector.size() != dimensions_) {
    throw std::invalid_argument(DimensionMismatch(dimensions_, vector.size()));
  }
  vectors_[id] = std::move(vector);
}

bool FlatVectorIndex::Remove(std::int64_t id) {
  return vectors_.erase(id) > 0;
}

std::vector<VectorHit> FlatVectorIndex::Search(std::span<const float> query, std::size_t limit) const {
  if (query.size() != dimensions_) {
    throw std::invalid_argument(DimensionMismatch(dimensions_, query.size()));
  }
  if (limit == 0 || vectors_.empty()) {
    return {};
  }

  std::vector<VectorHit> hits{};
  hits.reserve(vectors_.size());
  for (const auto& [id, vector] : vectors_) {
    hits.push_back(VectorHit{.id = id, .similarity = CosineSimilarity(query, vector)});
  }
  std::sort(hits.begin(), hits.end(), [](const VectorHit& lhs, const VectorHit& rhs) {
    if (lhs.similarity != rhs.similarity) {
      return lhs.similarity > rhs.similarity;
    }
    return lhs.id < rhs.id;
  });
  if (hits.size() > limit) {
    hits.resize(limit);
  }
  return hits;
}

CatalogIndex::CatalogIndex()
    : text_(kTextEmbeddingDims),
      images_(kVisualEmbeddingDims),
      videos_(kVisualEmbeddingDims),
      blends_(kVisualEmbeddingDims) {}

CatalogIndex CatalogIndex::Build(const CatalogStore& store) {
  CatalogIndex index{};
  for (auto& row : store.TextEmbeddings()) {
    index.text_.Add(row.file_id, std::move(row.vector));
  }
  for (const auto type : {FileType::kImage, FileType::kVideo, FileType::kBlend}) {
    auto& visual = index.mutable_visual(type);
    for (auto& row : store.VisualEmbeddings(type)) {
      visual.Add(row.file_id, std::move(row.vector));
    }
  }
  spdlog::info("catalog index built: text={} images={} videos={} blends={}",
               index.text_.size(),
               index.images_.size(),
               index.videos_.size(),
               index.blends_.size());
  return index;
}

const FlatVectorIndex& CatalogIndex::visual(FileType type) const {
  switch (type) {
    case FileType::kImage:
      return images_;
    case FileType::kVideo:
      return videos_;
    case FileType::kBlend:
      return blends_;
    default:
      break;
  }
  throw std::invalid_argument("no visual index for file type " + std::string(FileTypeName(type)));
}

FlatVectorIndex& CatalogIndex::mutable_visual(FileType type) {
  return const_cast<FlatVectorIndex&>(static_cast<const CatalogIndex&>(*this).visual(type));
}

}  // namespace sceneseek
