#include "sceneseek/catalog_import.hpp"
#include "sceneseek/catalog_store.hpp"
#include "sceneseek/embeddings.hpp"

#include "../test_logger.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

sceneseek::Json SampleDocument() {
  return sceneseek::Json::parse(R"json({
    "files": [
      {"id": 1, "name": "opening_shot.blend", "path": "/shows/orbit/opening_shot.blend", "type": "blend",
       "extension": ".blend", "size": 52000, "created_at": 100, "modified_at": 200, "show": "orbit",
       "extension_info": {"kind": "blend", "width": 3840, "height": 2160, "render_engine": "CYCLES",
                          "frame_count": 120, "thumbnail_path": "s3://thumbs/orbit/blend/1_thumb.jpg"}},
      {"id": 2, "name": "theme.flac", "path": "/shows/orbit/audio/theme.flac", "type": "audio",
       "extension": "FLAC", "modified_at": 300,
       "extension_info": {"kind": "audio", "duration_seconds": 180.5, "channels": 2, "sample_rate": 96000}},
      {"id": 3, "name": "corrupt.exr", "path": "/shows/orbit/corrupt.exr", "type": "image",
       "extension": ".exr", "modified_at": 50, "error": "truncated file",
       "extension_info": {"kind": "image", "width": 10, "height": 10}},
      {"id": 4, "name": "notes.txt", "type": "document", "modified_at": 60}
    ]
  })json");
}

void ScenarioParseDocument() {
  sceneseek::tests::Log("scenario: parse catalog document");
  const auto records = sceneseek::ParseCatalogDocument(SampleDocument());
  Require(records.size() == 4, "all file entries must parse");
  Require(records[0].file.type == sceneseek::FileType::kBlend, "type parses from its name");
  Require(records[0].extension.has_value(), "nested extension_info must parse");
  const auto& blend = std::get<sceneseek::BlendInfo>(*records[0].extension);
  Require(blend.resolution.width == 3840 && blend.frame_count == 120, "blend fields mismatch");
  Require(blend.thumbnail_path == std::optional<std::string>("s3://thumbs/orbit/blend/1_thumb.jpg"),
          "thumbnail reference mismatch");
  Require(records[3].file.path == "notes.txt", "path defaults to the name");
  Require(!records[3].extension.has_value(), "files without extension_info carry none");

  const auto bare = sceneseek::ParseCatalogDocument(SampleDocument()["files"]);
  Require(bare.size() == 4, "a bare array is accepted");
}

void ScenarioRejectsMalformedDocuments() {
  sceneseek::tests::Log("scenario: rejects malformed documents");
  auto rejects = [](const sceneseek::Json& document) {
    try {
      (void)sceneseek::ParseCatalogDocument(document);
    } catch (const std::exception&) {
      return true;
    }
    return false;
  };
  Require(rejects(sceneseek::Json::object()), "an object without files must be rejected");
  Require(rejects(sceneseek::Json{{"files", 3}}), "files must be an array");
  Require(rejects(sceneseek::Json::parse(R"([{"id": 1, "name": "x", "type": "hologram"}])")),
          "unknown file type must be rejected");
  Require(rejects(sceneseek::Json::parse(R"([{"id": 1, "name": "x", "type": "image",
                                              "extension_info": {"width": 1}}])")),
          "extension without kind must be rejected");
}

void ScenarioImportFillsEmbeddings() {
  sceneseek::tests::Log("scenario: import fills missing embeddings");
  sceneseek::CatalogStore store(":memory:");
  sceneseek::HashingEmbeddingProvider embedder;
  const auto count = sceneseek::ImportCatalog(store, SampleDocument(), &embedder);
  Require(count == 4, "import must report every file");
  Require(store.TotalFiles() == 4, "every file must be stored");

  const auto blend = store.GetRecord(1);
  Require(blend->file.embedding.has_value(), "text embedding must be filled");
  const auto& blend_info = std::get<sceneseek::BlendInfo>(*blend->extension);
  Require(blend_info.visual_embedding.has_value() &&
              blend_info.visual_embedding->size() == sceneseek::kVisualEmbeddingDims,
          "visual embedding must be filled for visual extensions");

  const auto audio = store.GetRecord(2);
  Require(audio->file.extension == ".flac", "extension is normalized on import");

  const auto corrupt = store.GetRecord(3);
  Require(corrupt->file.error == std::optional<std::string>("truncated file"), "existing error is kept");
  Require(!corrupt->file.embedding.has_value(), "a failed file is never embedded");
  Require(!std::get<sceneseek::ImageInfo>(*corrupt->extension).visual_embedding.has_value(),
          "a failed file gets no visual embedding");

  Require(store.TextEmbeddings().size() == 3, "three healthy files carry text embeddings");
  Require(store.VisualEmbeddings(sceneseek::FileType::kBlend).size() == 1, "one blend visual embedding");
}

void ScenarioEmbeddingFailureBecomesError() {
  sceneseek::tests::Log("scenario: embedding failure becomes file error");
  sceneseek::EmbeddingLimits limits{};
  limits.max_text_bytes = 8;
  sceneseek::HashingEmbeddingProvider embedder(limits);
  auto records = sceneseek::ParseCatalogDocument(SampleDocument());
  sceneseek::FillMissingEmbeddings(records, embedder);
  for (const auto& record : records) {
    Require(!(record.file.embedding.has_value() && record.file.error.has_value()),
            "a file must never carry both an embedding and an error");
  }
  Require(records[0].file.error.has_value(), "an over-limit description must be recorded as the file error");
}

void ScenarioImportWithoutEmbedder() {
  sceneseek::tests::Log("scenario: import without embedder");
  sceneseek::CatalogStore store(":memory:");
  Require(sceneseek::ImportCatalog(store, SampleDocument(), nullptr) == 4, "import without embedder must succeed");
  Require(store.TextEmbeddings().empty(), "no embeddings are invented without a provider");
}

}  // namespace

int main() {
  try {
    sceneseek::tests::Log("catalog_import_test: start");
    ScenarioParseDocument();
    ScenarioRejectsMalformedDocuments();
    ScenarioImportFillsEmbeddings();
    ScenarioEmbeddingFailureBecomesError();
    ScenarioImportWithoutEmbedder();
    sceneseek::tests::Log("catalog_import_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    sceneseek::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
