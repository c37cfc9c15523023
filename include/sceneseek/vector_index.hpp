#pragma once

#include "sceneseek/types.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <unordered_map>
#include <vector>

namespace sceneseek {

class CatalogStore;

struct VectorHit {
  std::int64_t id = 0;
  float similarity = 0.0F;
};

// Exact cosine nearest-neighbour index over a fixed dimensionality.
class FlatVectorIndex {
 public:
  explicit FlatVectorIndex(std::size_t dimensions);

  [[nodiscard]] std::size_t dimensions() const { return dimensions_; }
  [[nodiscard]] std::size_t size() const { return vectors_.size(); }

  void Add(std::int64_t id, std::vector<float> vector);
  bool Remove(std::int64_t id);
  // Highest cosine similarity first, ties by lower id.
  std::vector<VectorHit> Search(std::span<const float> query, std::size_t limit) const;

 private:
  std::size_t dimensions_ = 0;
  std::unordered_map<std::int64_t, std::vector<float>> vectors_{};
};

// Text index plus one visual index per visual-bearing extension type. Built
// once before serving and read-only afterwards.
class CatalogIndex {
 public:
  CatalogIndex();

  static CatalogIndex Build(const CatalogStore& store);

  [[nodiscard]] const FlatVectorIndex& text() const { return text_; }
  [[nodiscard]] const FlatVectorIndex& visual(FileType type) const;
  FlatVectorIndex& mutable_text() { return text_; }
  FlatVectorIndex& mutable_visual(FileType type);

 private:
  FlatVectorIndex text_;
  FlatVectorIndex images_;
  FlatVectorIndex videos_;
  FlatVectorIndex blends_;
};

}  // namespace sceneseek
