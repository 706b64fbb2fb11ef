#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace imgpipe::app {

/// Job queue implementation.
enum class QueueBackendType {
  Pool,
  Tbb,
};

/// Caption model type: mock (fixed text) or onnx (real model).
enum class CaptionBackendType {
  Mock,
  Onnx,
};

/// Service configuration: storage locations, limits, workers, model.
struct ServiceConfig {
  std::string db_path;
  std::string media_dir;
  std::string base_url;
  std::uint64_t max_pixels{0};
  std::uint64_t max_upload_bytes{0};
  std::size_t worker_count{0};
  std::size_t queue_capacity{0};
  QueueBackendType queue_backend{QueueBackendType::Pool};
  std::uint32_t thumbnail_small{0};
  std::uint32_t thumbnail_medium{0};
  int thumbnail_quality{0};
  CaptionBackendType caption_backend{CaptionBackendType::Mock};
  std::string caption_model_path;
  std::string caption_vocab_path;
  std::uint32_t caption_max_edge{0};
  std::string log_level;
};

/// Load config from a simple key=value file (one per line) or use defaults.
/// IMGPIPE_DB_PATH, IMGPIPE_MEDIA_DIR and IMGPIPE_BASE_URL override the file.
/// Throws std::invalid_argument for a malformed numeric value.
ServiceConfig load_config(const std::string& path);

/// Default config when no file is provided (environment overrides applied).
ServiceConfig default_config();

}  // namespace imgpipe::app
