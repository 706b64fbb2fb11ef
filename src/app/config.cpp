#include <imgpipe/app/config.hpp>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace imgpipe::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

std::uint64_t parse_unsigned(const std::string& key, const std::string& value) {
  std::size_t used = 0;
  unsigned long long v = 0;
  try {
    v = std::stoull(value, &used);
  } catch (const std::exception&) {
    throw std::invalid_argument("config: " + key + " expects a number, got '" + value + "'");
  }
  if (used != value.size() || value.front() == '-') {
    throw std::invalid_argument("config: " + key + " expects a number, got '" + value + "'");
  }
  return static_cast<std::uint64_t>(v);
}

void apply_env(ServiceConfig& c) {
  if (const char* v = std::getenv("IMGPIPE_DB_PATH"); v && *v) c.db_path = v;
  if (const char* v = std::getenv("IMGPIPE_MEDIA_DIR"); v && *v) c.media_dir = v;
  if (const char* v = std::getenv("IMGPIPE_BASE_URL"); v && *v) c.base_url = v;
}

ServiceConfig builtin_defaults() {
  ServiceConfig c;
  c.db_path = "database.db";
  c.media_dir = "media";
  c.base_url = "http://localhost:8000";
  c.max_pixels = 50'000'000;
  c.max_upload_bytes = 100ull * 1024 * 1024;
  c.worker_count = 0;
  c.queue_capacity = 1024;
  c.queue_backend = QueueBackendType::Pool;
  c.thumbnail_small = 256;
  c.thumbnail_medium = 768;
  c.thumbnail_quality = 85;
  c.caption_backend = CaptionBackendType::Mock;
  c.caption_max_edge = 1024;
  c.log_level = "info";
  return c;
}

}  // namespace

ServiceConfig default_config() {
  ServiceConfig c = builtin_defaults();
  apply_env(c);
  return c;
}

ServiceConfig load_config(const std::string& path) {
  ServiceConfig c = builtin_defaults();
  std::ifstream f(path);
  if (!f) {
    apply_env(c);
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "db_path") c.db_path = value;
    else if (key == "media_dir") c.media_dir = value;
    else if (key == "base_url") c.base_url = value;
    else if (key == "max_pixels") c.max_pixels = parse_unsigned(key, value);
    else if (key == "max_upload_bytes") c.max_upload_bytes = parse_unsigned(key, value);
    else if (key == "worker_count") c.worker_count = static_cast<std::size_t>(parse_unsigned(key, value));
    else if (key == "queue_capacity") c.queue_capacity = static_cast<std::size_t>(parse_unsigned(key, value));
    else if (key == "queue_backend") {
      if (value == "tbb") c.queue_backend = QueueBackendType::Tbb;
      else if (value == "pool") c.queue_backend = QueueBackendType::Pool;
    }
    else if (key == "thumbnail_small") c.thumbnail_small = static_cast<std::uint32_t>(parse_unsigned(key, value));
    else if (key == "thumbnail_medium") c.thumbnail_medium = static_cast<std::uint32_t>(parse_unsigned(key, value));
    else if (key == "thumbnail_quality") c.thumbnail_quality = static_cast<int>(parse_unsigned(key, value));
    else if (key == "caption_backend") {
      if (value == "onnx") c.caption_backend = CaptionBackendType::Onnx;
      else if (value == "mock") c.caption_backend = CaptionBackendType::Mock;
    }
    else if (key == "caption_model_path") c.caption_model_path = value;
    else if (key == "caption_vocab_path") c.caption_vocab_path = value;
    else if (key == "caption_max_edge") c.caption_max_edge = static_cast<std::uint32_t>(parse_unsigned(key, value));
    else if (key == "log_level") c.log_level = value;
  }
  apply_env(c);
  return c;
}

}  // namespace imgpipe::app
