#pragma once

#include "sceneseek/types.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sceneseek {

struct EmbeddingLimits {
  std::size_t max_text_bytes = 8192;
  std::size_t max_image_bytes = 10 * 1024 * 1024;
};

// Maps text or images into the 384-dim text space or the 512-dim cross-modal
// visual space. Implementations are deterministic and throw EmbeddingFailure on
// empty, corrupt or oversized input.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<float> EmbedText(const std::string& text) = 0;
  virtual std::vector<float> EmbedImage(std::span<const std::uint8_t> bytes) = 0;
  virtual std::vector<float> EmbedTextForVisualSpace(const std::string& text) = 0;
};

// Feature-hashing encoder. Text tokens and image byte windows are hashed into
// signed buckets and L2-normalized, so equal input always yields equal vectors.
class HashingEmbeddingProvider final : public EmbeddingProvider {
 public:
  explicit HashingEmbeddingProvider(EmbeddingLimits limits = {}, std::size_t memoization_capacity = 4096);

  std::vector<float> EmbedText(const std::string& text) override;
  std::vector<float> EmbedImage(std::span<const std::uint8_t> bytes) override;
  std::vector<float> EmbedTextForVisualSpace(const std::string& text) override;

  [[nodiscard]] std::size_t cache_size() const;
  [[nodiscard]] const EmbeddingLimits& limits() const { return limits_; }

 private:
  std::vector<float> EmbedTokens(const std::string& text, std::size_t dims, std::uint64_t seed);

  EmbeddingLimits limits_{};
  std::size_t memoization_capacity_ = 0;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::vector<float>> memoized_embeddings_{};
  std::deque<std::string> memoization_order_{};
};

bool HasKnownImageSignature(std::span<const std::uint8_t> bytes);

// Throws std::invalid_argument on characters outside the standard alphabet.
std::vector<std::uint8_t> DecodeBase64(std::string_view encoded);

}  // namespace sceneseek
