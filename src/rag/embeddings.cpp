#include "sceneseek/embeddings.hpp"

#include "sceneseek/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sceneseek {
namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;
constexpr std::uint64_t kTextSeed = 0x7465787400000000ULL;
constexpr std::uint64_t kVisualSeed = 0x76697375616c0000ULL;
constexpr std::size_t kImageWindow = 4;

std::vector<std::string> Tokenize(std::string_view text) {
  std::vector<std::string> tokens{};
  std::string current{};
  current.reserve(32);

  for (const unsigned char ch : text) {
    if (std::isalnum(ch) != 0) {
      current.push_back(static_cast<char>(std::tolower(ch)));
      continue;
    }
    if (!current.empty()) {
      tokens.push_back(current);
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(current);
  }
  return tokens;
}

std::uint64_t HashBytes(std::uint64_t seed, std::span<const std::uint8_t> bytes) {
  std::uint64_t hash = kFnvOffset ^ seed;
  for (const auto byte : bytes) {
    hash ^= static_cast<std::uint64_t>(byte);
    hash *= kFnvPrime;
  }
  return hash;
}

std::uint64_t HashToken(std::uint64_t seed, std::string_view token) {
  return HashBytes(seed, std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(token.data()),
                                                       token.size()));
}

void Accumulate(std::vector<float>& embedding, std::uint64_t hash) {
  const auto index = static_cast<std::size_t>(hash % static_cast<std::uint64_t>(embedding.size()));
  const float sign = ((hash >> 63U) != 0U) ? -1.0F : 1.0F;
  embedding[index] += sign;
}

void NormalizeL2(std::vector<float>& v) {
  double sum_sq = 0.0;
  for (const auto x : v) {
    sum_sq += static_cast<double>(x) * static_cast<double>(x);
  }
  if (sum_sq <= 0.0) {
    return;
  }
  const auto inv_norm = 1.0 / std::sqrt(sum_sq);
  for (auto& x : v) {
    x = static_cast<float>(static_cast<double>(x) * inv_norm);
  }
}

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

bool StartsWith(std::span<const std::uint8_t> bytes, std::initializer_list<std::uint8_t> prefix, std::size_t offset = 0) {
  if (bytes.size() < offset + prefix.size()) {
    return false;
  }
  std::size_t i = offset;
  for (const auto expected : prefix) {
    if (bytes[i++] != expected) {
      return false;
    }
  }
  return true;
}

int Base64Value(char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    return ch - 'A';
  }
  if (ch >= 'a' && ch <= 'z') {
    return ch - 'a' + 26;
  }
  if (ch >= '0' && ch <= '9') {
    return ch - '0' + 52;
  }
  if (ch == '+' || ch == '-') {
    return 62;
  }
  if (ch == '/' || ch == '_') {
    return 63;
  }
  return -1;
}

}  // namespace

HashingEmbeddingProvider::HashingEmbeddingProvider(EmbeddingLimits limits, std::size_t memoization_capacity)
    : limits_(limits), memoization_capacity_(memoization_capacity) {}

std::vector<float> HashingEmbeddingProvider::EmbedText(const std::string& text) {
  return EmbedTokens(text, kTextEmbeddingDims, kTextSeed);
}

std::vector<float> HashingEmbeddingProvider::EmbedTextForVisualSpace(const std::string& text) {
  return EmbedTokens(text, kVisualEmbeddingDims, kVisualSeed);
}

std::vector<float> HashingEmbeddingProvider::EmbedImage(std::span<const std::uint8_t> bytes) {
  if (bytes.empty()) {
    throw EmbeddingFailure("image input is empty");
  }
  if (bytes.size() > limits_.max_image_bytes) {
    throw EmbeddingFailure("image input exceeds " + std::to_string(limits_.max_image_bytes) + " bytes");
  }
  if (!HasKnownImageSignature(bytes)) {
    throw EmbeddingFailure("corrupt image: unrecognized signature");
  }

  std::vector<float> embedding(kVisualEmbeddingDims, 0.0F);
  if (bytes.size() < kImageWindow) {
    Accumulate(embedding, HashBytes(kVisualSeed, bytes));
  } else {
    for (std::size_t i = 0; i + kImageWindow <= bytes.size(); ++i) {
      Accumulate(embedding, HashBytes(kVisualSeed, bytes.subspan(i, kImageWindow)));
    }
  }
  NormalizeL2(embedding);
  return embedding;
}

std::vector<float> HashingEmbeddingProvider::EmbedTokens(const std::string& text, std::size_t dims, std::uint64_t seed) {
  const auto trimmed = Trim(text);
  if (trimmed.empty()) {
    throw EmbeddingFailure("embedding input is empty");
  }
  if (trimmed.size() > limits_.max_text_bytes) {
    throw EmbeddingFailure("embedding input exceeds " + std::to_string(limits_.max_text_bytes) + " bytes");
  }
  const auto tokens = Tokenize(trimmed);
  if (tokens.empty()) {
    throw EmbeddingFailure("embedding input has no tokens");
  }

  std::string key = std::to_string(dims);
  key.push_back(':');
  key.append(trimmed);

  if (memoization_capacity_ > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto cached = memoized_embeddings_.find(key);
    if (cached != memoized_embeddings_.end()) {
      return cached->second;
    }
  }

  std::vector<float> embedding(dims, 0.0F);
  for (const auto& token : tokens) {
    Accumulate(embedding, HashToken(seed, token));
  }
  NormalizeL2(embedding);

  if (memoization_capacity_ > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    while (memoized_embeddings_.size() >= memoization_capacity_ && !memoization_order_.empty()) {
      memoized_embeddings_.erase(memoization_order_.front());
      memoization_order_.pop_front();
    }
    if (memoized_embeddings_.emplace(key, embedding).second) {
      memoization_order_.push_back(key);
    }
  }
  return embedding;
}

std::size_t HashingEmbeddingProvider::cache_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return memoized_embeddings_.size();
}

bool HasKnownImageSignature(std::span<const std::uint8_t> bytes) {
  return StartsWith(bytes, {0xFF, 0xD8, 0xFF}) ||                                  // JPEG
         StartsWith(bytes, {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A}) ||  // PNG
         StartsWith(bytes, {0x47, 0x49, 0x46, 0x38}) ||                            // GIF8
         StartsWith(bytes, {0x42, 0x4D}) ||                                        // BMP
         (StartsWith(bytes, {0x52, 0x49, 0x46, 0x46}) && StartsWith(bytes, {0x57, 0x45, 0x42, 0x50}, 8));
}

std::vector<std::uint8_t> DecodeBase64(std::string_view encoded) {
  std::vector<std::uint8_t> out{};
  out.reserve(encoded.size() / 4 * 3);
  std::uint32_t buffer = 0;
  int bits = 0;
  for (const char ch : encoded) {
    if (ch == '=') {
      break;
    }
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      continue;
    }
    const int value = Base64Value(ch);
    if (value < 0) {
      throw std::invalid_argument("invalid base64 character");
    }
    buffer = (buffer << 6U) | static_cast<std::uint32_t>(value);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<std::uint8_t>((buffer >> static_cast<std::uint32_t>(bits)) & 0xFFU));
    }
  }
  return out;
}

}  // namespace sceneseek
