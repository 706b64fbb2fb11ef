#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace imgpipe::core {

/// Raw EXIF payload (BYTE / UNDEFINED tags). Serialized as {"$hex": "..."}.
struct ExifBytes {
  std::vector<std::byte> data;

  bool operator==(const ExifBytes&) const = default;
};

/// Closed variant for one EXIF tag value: string, integer, real, boolean,
/// byte blob or nested tag map (GPS IFD, multi-valued numerics).
/// Nested maps are immutable and shared between copies.
class ExifValue {
 public:
  using Map = std::map<std::string, ExifValue>;
  using Storage = std::variant<std::string,
                               std::int64_t,
                               double,
                               bool,
                               ExifBytes,
                               std::shared_ptr<const Map>>;

  ExifValue() : storage_(std::string{}) {}
  ExifValue(std::string s) : storage_(std::move(s)) {}
  ExifValue(const char* s) : storage_(std::string(s)) {}
  ExifValue(std::int64_t i) : storage_(i) {}
  ExifValue(double d) : storage_(d) {}
  ExifValue(bool b) : storage_(b) {}
  ExifValue(ExifBytes bytes) : storage_(std::move(bytes)) {}
  ExifValue(Map nested) : storage_(std::make_shared<const Map>(std::move(nested))) {}

  [[nodiscard]] const Storage& storage() const noexcept { return storage_; }

  [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(storage_); }
  [[nodiscard]] bool is_integer() const noexcept { return std::holds_alternative<std::int64_t>(storage_); }
  [[nodiscard]] bool is_real() const noexcept { return std::holds_alternative<double>(storage_); }
  [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(storage_); }
  [[nodiscard]] bool is_bytes() const noexcept { return std::holds_alternative<ExifBytes>(storage_); }
  [[nodiscard]] bool is_map() const noexcept {
    return std::holds_alternative<std::shared_ptr<const Map>>(storage_);
  }

  /// Accessors; callers check the matching is_*() first.
  [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(storage_); }
  [[nodiscard]] std::int64_t as_integer() const { return std::get<std::int64_t>(storage_); }
  [[nodiscard]] double as_real() const { return std::get<double>(storage_); }
  [[nodiscard]] bool as_bool() const { return std::get<bool>(storage_); }
  [[nodiscard]] const ExifBytes& as_bytes() const { return std::get<ExifBytes>(storage_); }
  [[nodiscard]] const Map& as_map() const { return *std::get<std::shared_ptr<const Map>>(storage_); }

  /// Deep equality (nested maps compared by content).
  friend bool operator==(const ExifValue& a, const ExifValue& b);

 private:
  Storage storage_;
};

using ExifMap = ExifValue::Map;

/// Serialize to compact UTF-8 JSON. Integers stay integers, reals keep a
/// fractional part, byte blobs become {"$hex": "..."}; parsing the output
/// with exif_from_json yields an equal map.
[[nodiscard]] std::string exif_to_json(const ExifMap& map);

/// Parse a payload produced by exif_to_json. Returns the parser message on failure.
[[nodiscard]] std::expected<ExifMap, std::string> exif_from_json(std::string_view text);

}  // namespace imgpipe::core
