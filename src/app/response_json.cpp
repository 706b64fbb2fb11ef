#include <imgpipe/app/response_json.hpp>
#include <memory>

namespace imgpipe::app {

namespace {

Json::Value optional_string(const std::optional<std::string>& v) {
  return v ? Json::Value(*v) : Json::Value(Json::nullValue);
}

Json::Value exif_value(const std::string& text) {
  Json::CharReaderBuilder builder;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value parsed;
  std::string errs;
  if (reader->parse(text.data(), text.data() + text.size(), &parsed, &errs) && parsed.isObject()) {
    return parsed;
  }
  Json::Value raw(Json::objectValue);
  raw["_raw"] = text;
  return raw;
}

Json::Value metadata_json(const ImageMetadata& m) {
  Json::Value j(Json::objectValue);
  j["width"] = m.width;
  j["height"] = m.height;
  j["format"] = m.format;
  j["size_bytes"] = static_cast<Json::UInt64>(m.size_bytes);
  j["sha256"] = m.sha256;
  j["first_upload"] = core::format_timestamp(m.first_upload);
  j["exif_json"] = m.exif_json ? exif_value(*m.exif_json) : Json::Value(Json::nullValue);
  j["caption"] = optional_string(m.caption);
  return j;
}

}  // namespace

Json::Value to_json(const UploadResponse& response) {
  Json::Value data(Json::objectValue);
  data["image_id"] = response.data.image_id;
  data["original_name"] = response.data.original_name;
  data["processed_at"] = core::format_timestamp(response.data.processed_at);
  data["stored_path"] = optional_string(response.data.stored_path);
  data["metadata"] = response.data.metadata ? metadata_json(*response.data.metadata)
                                            : Json::Value(Json::nullValue);
  if (response.data.thumbnails.empty()) {
    data["thumbnails"] = Json::Value(Json::nullValue);
  } else {
    Json::Value thumbs(Json::objectValue);
    for (const auto& [name, url] : response.data.thumbnails) {
      thumbs[name] = url;
    }
    data["thumbnails"] = thumbs;
  }

  Json::Value root(Json::objectValue);
  root["status"] = std::string(to_string(response.status));
  root["data"] = data;
  root["error"] = optional_string(response.error);
  return root;
}

Json::Value to_json(const std::vector<UploadResponse>& responses) {
  Json::Value arr(Json::arrayValue);
  for (const auto& r : responses) {
    arr.append(to_json(r));
  }
  return arr;
}

Json::Value to_json(const ProcessingStats& stats) {
  Json::Value j(Json::objectValue);
  j["total"] = static_cast<Json::UInt64>(stats.total);
  j["failed"] = static_cast<Json::UInt64>(stats.failed);
  j["successRate"] = stats.success_rate;
  j["avgProcessingSeconds"] = stats.average_processing_seconds;
  return j;
}

std::string write_json(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, value);
}

}  // namespace imgpipe::app
