#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "chunkguard/api.hpp"
#include "chunkguard/chunking/measure.hpp"
#include "chunkguard/config/config.hpp"
#include "chunkguard/observability/factory.hpp"
#include "chunkguard/observability/global.hpp"

void register_pipeline_integration_tests(chunkguard::tests::TestList &tests) {
  using chunkguard::tests::require;
  using chunkguard::testing::TempDir;

  tests.push_back({"pipeline_integration_config_to_chunks", [] {
                     TempDir dir;
                     const auto path = dir.create_file("config.toml", R"(
[defaults]
chunk_overlap = 4
respect_word_boundaries = true

[observability]
backend = "none"

[limits.local."edge-1"]
max_tokens = 50
max_chars = 64
max_bytes = 128
max_images = 1
image_byte_limit = 32
)");
                     chunkguard::config::set_config_path_override(dir.path());
                     const auto config = chunkguard::config::load_config();
                     chunkguard::config::clear_config_path_override();
                     require(config.ok(), config.ok() ? "" : config.error());
                     require(path.filename() == "config.toml", "fixture path");

                     const auto warnings = chunkguard::config::validate_config(config.value());
                     require(warnings.ok(), "config should validate");
                     require(warnings.value().empty(), "config should not warn");

                     const auto registry = config.value().registry();
                     chunkguard::observability::set_global_observer(
                         chunkguard::observability::create_observer(config.value()));

                     chunkguard::ChunkRequest request;
                     request.provider = "local";
                     request.model = "edge-1";
                     request.input = chunkguard::testing::repeat("Short line here. ", 30);
                     request.images.push_back(
                         chunkguard::images::Base64Image{"data:image/png;base64,aGVsbG8="});
                     request.options = config.value().chunk_options();

                     const auto result = chunkguard::chunk_prompt(request, registry);
                     chunkguard::observability::set_global_observer(nullptr);
                     require(result.ok(), result.ok() ? "" : result.error().to_string());

                     const auto &chunks = result.value().chunks;
                     require(chunks.size() > 1, "input should be split");
                     require(chunks[0].images.size() == 1, "image on the first chunk");
                     const auto limits = *registry.resolve("local", "edge-1");
                     for (const auto &chunk : chunks) {
                       require(chunkguard::chunking::check_fits(chunk.text, chunk.images, limits).fits,
                               "every chunk fits the configured limits");
                     }
                     require(chunkguard::testing::reconstruct(chunks, 4) == request.input,
                             "overlap reconstruction");
                   }});

  tests.push_back({"pipeline_integration_builtin_catalog", [] {
                     chunkguard::ChunkRequest request;
                     request.provider = "ollama";
                     request.model = "llama3";
                     request.input = chunkguard::testing::repeat("tokens and more tokens ", 5'000);

                     const auto result = chunkguard::chunk_prompt(request);
                     require(result.ok(), "ollama preset should partition");
                     const auto &metadata = result.value().metadata;
                     require(metadata.total_chunks == result.value().chunks.size(), "count");
                     require(metadata.estimated_bytes == request.input.size(),
                             "no overlap means bytes add up");
                   }});
}
