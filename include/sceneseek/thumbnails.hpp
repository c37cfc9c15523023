#pragma once

#include "sceneseek/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace sceneseek {

class ThumbnailUrlProvider {
 public:
  virtual ~ThumbnailUrlProvider() = default;
  virtual std::optional<std::string> UrlFor(const SearchResult& result) const = 0;
};

// "<show or other>/<images|videos|blend>/<id>_thumb.jpg"; empty for types
// without a rendered preview.
std::string DefaultThumbnailKey(const SearchResult& result);

// Drops an "s3://<bucket>/" prefix so stored references become plain keys.
std::string_view StripBucketPrefix(std::string_view reference);

// Serves thumbnails from a fixed base URL with an expiry hint.
class StaticThumbnailUrlProvider final : public ThumbnailUrlProvider {
 public:
  StaticThumbnailUrlProvider(std::string base_url, int expiry_seconds);

  std::optional<std::string> UrlFor(const SearchResult& result) const override;

 private:
  std::string base_url_;
  int expiry_seconds_ = 0;
};

}  // namespace sceneseek
