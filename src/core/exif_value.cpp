#include <imgpipe/core/exif_value.hpp>
#include <imgpipe/core/digest.hpp>
#include <json/json.h>
#include <memory>
#include <optional>
#include <sstream>

namespace imgpipe::core {

namespace {

constexpr const char* kHexKey = "$hex";

std::optional<std::vector<std::byte>> from_hex(const std::string& hex) {
  if (hex.size() % 2 != 0) return std::nullopt;
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  std::vector<std::byte> out;
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = nibble(hex[i]);
    const int lo = nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    out.push_back(static_cast<std::byte>((hi << 4) | lo));
  }
  return out;
}

Json::Value to_json_value(const ExifValue& v);

Json::Value map_to_json(const ExifMap& map) {
  Json::Value obj(Json::objectValue);
  for (const auto& [key, value] : map) {
    obj[key] = to_json_value(value);
  }
  return obj;
}

Json::Value to_json_value(const ExifValue& v) {
  if (v.is_string()) return Json::Value(v.as_string());
  if (v.is_integer()) return Json::Value(static_cast<Json::Int64>(v.as_integer()));
  if (v.is_real()) return Json::Value(v.as_real());
  if (v.is_bool()) return Json::Value(v.as_bool());
  if (v.is_bytes()) {
    Json::Value blob(Json::objectValue);
    blob[kHexKey] = to_hex(v.as_bytes().data);
    return blob;
  }
  return map_to_json(v.as_map());
}

std::expected<ExifMap, std::string> map_from_json(const Json::Value& obj);

std::expected<ExifValue, std::string> from_json_value(const Json::Value& v) {
  switch (v.type()) {
    case Json::stringValue:
      return ExifValue(v.asString());
    case Json::intValue:
      return ExifValue(static_cast<std::int64_t>(v.asInt64()));
    case Json::uintValue:
      if (v.isInt64()) return ExifValue(static_cast<std::int64_t>(v.asInt64()));
      return ExifValue(v.asDouble());
    case Json::realValue:
      return ExifValue(v.asDouble());
    case Json::booleanValue:
      return ExifValue(v.asBool());
    case Json::objectValue: {
      if (v.size() == 1 && v.isMember(kHexKey) && v[kHexKey].isString()) {
        auto bytes = from_hex(v[kHexKey].asString());
        if (!bytes) return std::unexpected(std::string("invalid hex blob"));
        return ExifValue(ExifBytes{std::move(*bytes)});
      }
      auto nested = map_from_json(v);
      if (!nested) return std::unexpected(nested.error());
      return ExifValue(std::move(*nested));
    }
    case Json::nullValue:
    case Json::arrayValue:
    default:
      return std::unexpected(std::string("unsupported JSON value type"));
  }
}

std::expected<ExifMap, std::string> map_from_json(const Json::Value& obj) {
  ExifMap out;
  for (const auto& key : obj.getMemberNames()) {
    auto value = from_json_value(obj[key]);
    if (!value) return std::unexpected(key + ": " + value.error());
    out.emplace(key, std::move(*value));
  }
  return out;
}

}  // namespace

bool operator==(const ExifValue& a, const ExifValue& b) {
  if (a.storage_.index() != b.storage_.index()) return false;
  if (a.is_map()) return a.as_map() == b.as_map();
  return a.storage_ == b.storage_;
}

std::string exif_to_json(const ExifMap& map) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, map_to_json(map));
}

std::expected<ExifMap, std::string> exif_from_json(std::string_view text) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errs;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
    return std::unexpected(errs);
  }
  if (!root.isObject()) {
    return std::unexpected(std::string("EXIF payload is not a JSON object"));
  }
  return map_from_json(root);
}

}  // namespace imgpipe::core
