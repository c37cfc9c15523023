#include "sceneseek/thumbnails.hpp"

#include <string>
#include <utility>

namespace sceneseek {

std::string DefaultThumbnailKey(const SearchResult& result) {
  const char* folder = nullptr;
  switch (result.type) {
    case FileType::kImage:
      folder = "images";
      break;
    case FileType::kVideo:
      folder = "videos";
      break;
    case FileType::kBlend:
      folder = "blend";
      break;
    default:
      return {};
  }
  std::string key = result.show.value_or("other");
  key.push_back('/');
  key.append(folder);
  key.push_back('/');
  key.append(std::to_string(result.file_id));
  key.append("_thumb.jpg");
  return key;
}

std::string_view StripBucketPrefix(std::string_view reference) {
  constexpr std::string_view kScheme = "s3://";
  if (reference.substr(0, kScheme.size()) != kScheme) {
    return reference;
  }
  reference.remove_prefix(kScheme.size());
  const auto slash = reference.find('/');
  if (slash == std::string_view::npos) {
    return {};
  }
  return reference.substr(slash + 1);
}

StaticThumbnailUrlProvider::StaticThumbnailUrlProvider(std::string base_url, int expiry_seconds)
    : base_url_(std::move(base_url)), expiry_seconds_(expiry_seconds) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::optional<std::string> StaticThumbnailUrlProvider::UrlFor(const SearchResult& result) const {
  if (base_url_.empty()) {
    return std::nullopt;
  }
  std::string key{};
  if (result.thumbnail_path.has_value() && !result.thumbnail_path->empty()) {
    key = std::string(StripBucketPrefix(*result.thumbnail_path));
  } else {
    key = DefaultThumbnailKey(result);
  }
  if (key.empty()) {
    return std::nullopt;
  }
  std::string url = base_url_;
  url.push_back('/');
  url.append(key);
  if (expiry_seconds_ > 0) {
    url.append("?expires=");
    url.append(std::to_string(expiry_seconds_));
  }
  return url;
}

}  // namespace sceneseek
