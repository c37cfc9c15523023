#pragma once

#include "sceneseek/catalog_import.hpp"
#include "sceneseek/catalog_store.hpp"
#include "sceneseek/catalog_tools.hpp"
#include "sceneseek/embeddings.hpp"
#include "sceneseek/retrieval.hpp"
#include "sceneseek/tool_registry.hpp"
#include "sceneseek/types.hpp"
#include "sceneseek/vector_index.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sceneseek::tests {

// File ids of the seeded catalog.
namespace fixture_ids {
inline constexpr std::int64_t kHeroRender4k = 1;
inline constexpr std::int64_t kForestEnv8k = 2;
inline constexpr std::int64_t kCastleLookdev = 3;
inline constexpr std::int64_t kCastleTurntable4k = 4;
inline constexpr std::int64_t kDragonModel = 5;
inline constexpr std::int64_t kAmbientForest = 6;
inline constexpr std::int64_t kRenderFarmScript = 7;
inline constexpr std::int64_t kShotList = 8;
inline constexpr std::int64_t kBrokenScan = 9;
inline constexpr std::int64_t kStoryboardNotes = 10;
}  // namespace fixture_ids

inline CatalogFile MakeFile(std::int64_t id,
                            std::string name,
                            std::string path,
                            FileType type,
                            std::string extension,
                            std::int64_t modified_at,
                            std::optional<std::string> show) {
  CatalogFile file{};
  file.id = id;
  file.name = std::move(name);
  file.path = std::move(path);
  file.type = type;
  file.extension = std::move(extension);
  file.size = 1024 * (id + 1);
  file.created_at = modified_at - 1000;
  file.modified_at = modified_at;
  file.scanned_at = modified_at + 10;
  file.show = std::move(show);
  return file;
}

inline ImageInfo MakeImage(int width, int height) {
  ImageInfo info{};
  info.resolution = Resolution{width, height};
  info.color_mode = "RGB";
  return info;
}

// Ten files across every type and two shows. Modification times are
// distinct so recency ordering is total.
inline std::vector<CatalogRecord> FixtureRecords() {
  using namespace fixture_ids;
  std::vector<CatalogRecord> records{};

  records.push_back({MakeFile(kHeroRender4k, "hero_render_4k.png", "/projects/skyfall/renders/hero_render_4k.png",
                              FileType::kImage, ".png", 1700000500, "skyfall"),
                     MakeImage(3840, 2160)});
  records.push_back({MakeFile(kForestEnv8k, "forest_env_8k.exr", "/projects/skyfall/env/forest_env_8k.exr",
                              FileType::kImage, ".exr", 1700000900, "skyfall"),
                     MakeImage(7680, 4320)});

  BlendInfo lookdev{};
  lookdev.resolution = Resolution{1920, 1080};
  lookdev.render_engine = "CYCLES";
  lookdev.frame_count = 1;
  records.push_back({MakeFile(kCastleLookdev, "castle_lookdev.blend", "/projects/greenwood/lookdev/castle_lookdev.blend",
                              FileType::kBlend, ".blend", 1700000300, "greenwood"),
                     lookdev});

  VideoInfo turntable{};
  turntable.resolution = Resolution{3840, 2160};
  turntable.duration_seconds = 12.5;
  turntable.fps = 24.0;
  turntable.codec = "h264";
  records.push_back({MakeFile(kCastleTurntable4k, "castle_turntable_4k.mp4",
                              "/projects/greenwood/renders/castle_turntable_4k.mp4", FileType::kVideo, ".mp4",
                              1700000700, "greenwood"),
                     turntable});

  BlendInfo dragon{};
  dragon.resolution = Resolution{4096, 2160};
  dragon.render_engine = "EEVEE";
  dragon.frame_count = 240;
  records.push_back({MakeFile(kDragonModel, "dragon_model.blend", "/projects/skyfall/assets/dragon_model.blend",
                              FileType::kBlend, ".blend", 1700000100, "skyfall"),
                     dragon});

  AudioInfo ambient{};
  ambient.duration_seconds = 95.0;
  ambient.bitrate = 320;
  ambient.channels = 2;
  ambient.sample_rate = 48000;
  records.push_back({MakeFile(kAmbientForest, "ambient_forest.wav", "/projects/greenwood/audio/ambient_forest.wav",
                              FileType::kAudio, ".wav", 1700000200, "greenwood"),
                     ambient});

  records.push_back({MakeFile(kRenderFarmScript, "render_farm.py", "/pipeline/tools/render_farm.py", FileType::kCode,
                              ".py", 1700000400, std::nullopt),
                     CodeInfo{"python", 420}});

  records.push_back({MakeFile(kShotList, "shot_list.xlsx", "/projects/skyfall/production/shot_list.xlsx",
                              FileType::kSpreadsheet, ".xlsx", 1700000600, "skyfall"),
                     SpreadsheetInfo{3, 180}});

  auto broken = MakeFile(kBrokenScan, "broken_scan.tif", "/projects/skyfall/scans/broken_scan.tif", FileType::kImage,
                         ".tif", 1700000800, "skyfall");
  broken.error = "failed to read TIFF header";
  records.push_back({broken, MakeImage(1024, 768)});

  records.push_back({MakeFile(kStoryboardNotes, "storyboard_notes.pdf",
                              "/projects/greenwood/story/storyboard_notes.pdf", FileType::kDocument, ".pdf",
                              1700000050, "greenwood"),
                     DocumentInfo{14, 3200}});
  return records;
}

// In-memory catalog seeded with FixtureRecords, its index, a retriever and
// the registered catalog tools.
class CatalogFixture {
 public:
  CatalogFixture() : CatalogFixture(CatalogToolOptions{}) {}

  explicit CatalogFixture(CatalogToolOptions options) : store_(":memory:") {
    auto records = FixtureRecords();
    FillMissingEmbeddings(records, embedder_);
    store_.Import(records);
    index_ = CatalogIndex::Build(store_);
    retriever_ = std::make_unique<Retriever>(store_, index_);
    RegisterCatalogTools(registry_, *retriever_, embedder_, options);
  }

  CatalogStore& store() { return store_; }
  const CatalogIndex& index() const { return index_; }
  const Retriever& retriever() const { return *retriever_; }
  HashingEmbeddingProvider& embedder() { return embedder_; }
  const ToolRegistry& registry() const { return registry_; }

 private:
  CatalogStore store_;
  HashingEmbeddingProvider embedder_;
  CatalogIndex index_;
  std::unique_ptr<Retriever> retriever_;
  ToolRegistry registry_;
};

// Smallest byte sequences that pass the image signature check.
inline std::vector<std::uint8_t> PngBytes(std::uint8_t salt = 0) {
  return {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A, 0x00, 0x00, 0x00, 0x0D, 0x49, 0x48, 0x44, 0x52, salt, 0x10};
}

inline std::vector<std::uint8_t> JpegBytes() {
  return {0xFF, 0xD8, 0xFF, 0xE0, 0x00, 0x10, 0x4A, 0x46, 0x49, 0x46, 0x00, 0x01};
}

}  // namespace sceneseek::tests
