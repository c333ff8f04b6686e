#include "bench_common.hpp"

#include "chunkguard/config/config.hpp"

namespace {

constexpr const char *BENCH_CONFIG = R"(
[defaults]
chunk_overlap = 16

[limits.local.small]
max_tokens = 2_048
max_chars = 8_192
max_bytes = 8_192
max_images = 0
image_byte_limit = 0
)";

} // namespace

void run_config_benchmark() {
  chunkguard::bench::run_bench("config_parse", 2000,
                               [] { (void)chunkguard::config::parse_config(BENCH_CONFIG); });

  const auto parsed = chunkguard::config::parse_config(BENCH_CONFIG);
  if (!parsed.ok()) {
    std::cerr << "config_parse failed: " << parsed.error() << "\n";
    return;
  }
  chunkguard::bench::run_bench("config_validate", 2000, [&] {
    (void)chunkguard::config::validate_config(parsed.value());
  });
  chunkguard::bench::run_bench("config_registry", 500,
                               [&] { (void)parsed.value().registry(); });
}
