#pragma once

#include <imgpipe/app/stats.hpp>
#include <imgpipe/app/upload_response.hpp>
#include <json/json.h>
#include <string>
#include <vector>

namespace imgpipe::app {

/// {"status", "data": {image_id, original_name, processed_at, stored_path,
/// metadata | null, thumbnails | null}, "error"}. The stored EXIF text is
/// embedded as a JSON object, or as {"_raw": text} if it does not parse.
[[nodiscard]] Json::Value to_json(const UploadResponse& response);

[[nodiscard]] Json::Value to_json(const std::vector<UploadResponse>& responses);

/// {"total", "failed", "successRate", "avgProcessingSeconds"}.
[[nodiscard]] Json::Value to_json(const ProcessingStats& stats);

/// Indented rendering for the CLI.
[[nodiscard]] std::string write_json(const Json::Value& value);

}  // namespace imgpipe::app
