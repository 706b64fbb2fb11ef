#include <imgpipe/vision/exif_parser.hpp>
#include <algorithm>
#include <cstring>
#include <set>
#include <string_view>
#include <utility>

namespace imgpipe::vision {

namespace {

using imgpipe::core::ExifBytes;
using imgpipe::core::ExifMap;
using imgpipe::core::ExifValue;

constexpr std::uint16_t kExifIfdPointer = 0x8769;
constexpr std::uint16_t kGpsIfdPointer = 0x8825;
constexpr std::uint16_t kInteropIfdPointer = 0xA005;

struct TagName {
  std::uint16_t tag;
  const char* name;
};

constexpr TagName kExifTags[] = {
    {0x010E, "ImageDescription"},
    {0x010F, "Make"},
    {0x0110, "Model"},
    {0x0112, "Orientation"},
    {0x011A, "XResolution"},
    {0x011B, "YResolution"},
    {0x0128, "ResolutionUnit"},
    {0x0131, "Software"},
    {0x0132, "DateTime"},
    {0x013B, "Artist"},
    {0x013E, "WhitePoint"},
    {0x013F, "PrimaryChromaticities"},
    {0x0211, "YCbCrCoefficients"},
    {0x0213, "YCbCrPositioning"},
    {0x0214, "ReferenceBlackWhite"},
    {0x8298, "Copyright"},
    {0x829A, "ExposureTime"},
    {0x829D, "FNumber"},
    {0x8822, "ExposureProgram"},
    {0x8827, "ISOSpeedRatings"},
    {0x9000, "ExifVersion"},
    {0x9003, "DateTimeOriginal"},
    {0x9004, "DateTimeDigitized"},
    {0x9010, "OffsetTime"},
    {0x9011, "OffsetTimeOriginal"},
    {0x9101, "ComponentsConfiguration"},
    {0x9201, "ShutterSpeedValue"},
    {0x9202, "ApertureValue"},
    {0x9203, "BrightnessValue"},
    {0x9204, "ExposureBiasValue"},
    {0x9205, "MaxApertureValue"},
    {0x9206, "SubjectDistance"},
    {0x9207, "MeteringMode"},
    {0x9208, "LightSource"},
    {0x9209, "Flash"},
    {0x920A, "FocalLength"},
    {0x927C, "MakerNote"},
    {0x9286, "UserComment"},
    {0x9290, "SubsecTime"},
    {0x9291, "SubsecTimeOriginal"},
    {0x9292, "SubsecTimeDigitized"},
    {0xA000, "FlashPixVersion"},
    {0xA001, "ColorSpace"},
    {0xA002, "ExifImageWidth"},
    {0xA003, "ExifImageHeight"},
    {0xA217, "SensingMethod"},
    {0xA300, "FileSource"},
    {0xA301, "SceneType"},
    {0xA401, "CustomRendered"},
    {0xA402, "ExposureMode"},
    {0xA403, "WhiteBalance"},
    {0xA404, "DigitalZoomRatio"},
    {0xA405, "FocalLengthIn35mmFilm"},
    {0xA406, "SceneCaptureType"},
    {0xA408, "Contrast"},
    {0xA409, "Saturation"},
    {0xA40A, "Sharpness"},
    {0xA420, "ImageUniqueID"},
    {0xA430, "CameraOwnerName"},
    {0xA431, "BodySerialNumber"},
    {0xA432, "LensSpecification"},
    {0xA433, "LensMake"},
    {0xA434, "LensModel"},
};

constexpr TagName kGpsTags[] = {
    {0x0000, "GPSVersionID"},
    {0x0001, "GPSLatitudeRef"},
    {0x0002, "GPSLatitude"},
    {0x0003, "GPSLongitudeRef"},
    {0x0004, "GPSLongitude"},
    {0x0005, "GPSAltitudeRef"},
    {0x0006, "GPSAltitude"},
    {0x0007, "GPSTimeStamp"},
    {0x0008, "GPSSatellites"},
    {0x0009, "GPSStatus"},
    {0x000A, "GPSMeasureMode"},
    {0x000B, "GPSDOP"},
    {0x000C, "GPSSpeedRef"},
    {0x000D, "GPSSpeed"},
    {0x0010, "GPSImgDirectionRef"},
    {0x0011, "GPSImgDirection"},
    {0x0012, "GPSMapDatum"},
    {0x001B, "GPSProcessingMethod"},
    {0x001D, "GPSDateStamp"},
};

template <std::size_t N>
std::optional<std::string> lookup(const TagName (&table)[N], std::uint16_t tag) {
  for (const auto& t : table) {
    if (t.tag == tag) return std::string(t.name);
  }
  return std::nullopt;
}

enum TiffType : std::uint16_t {
  kByte = 1,
  kAscii = 2,
  kShort = 3,
  kLong = 4,
  kRational = 5,
  kSByte = 6,
  kUndefined = 7,
  kSShort = 8,
  kSLong = 9,
  kSRational = 10,
  kFloat = 11,
  kDouble = 12,
};

std::size_t type_size(std::uint16_t type) {
  switch (type) {
    case kByte:
    case kAscii:
    case kSByte:
    case kUndefined:
      return 1;
    case kShort:
    case kSShort:
      return 2;
    case kLong:
    case kSLong:
    case kFloat:
      return 4;
    case kRational:
    case kSRational:
    case kDouble:
      return 8;
    default:
      return 0;
  }
}

/// Bounds-checked reader over one TIFF block with its byte order.
class TiffReader {
 public:
  TiffReader(const unsigned char* base, std::size_t size, bool little_endian)
      : base_(base), size_(size), little_endian_(little_endian) {}

  [[nodiscard]] bool in_bounds(std::size_t offset, std::size_t len) const {
    return offset <= size_ && len <= size_ - offset;
  }

  [[nodiscard]] std::uint16_t u16(std::size_t off) const {
    const unsigned char* p = base_ + off;
    if (little_endian_) return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
    return static_cast<std::uint16_t>((p[0] << 8) | p[1]);
  }

  [[nodiscard]] std::uint32_t u32(std::size_t off) const {
    const unsigned char* p = base_ + off;
    if (little_endian_) {
      return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
             (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
    }
    return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
  }

  [[nodiscard]] std::uint64_t u64(std::size_t off) const {
    const std::uint64_t first = u32(off);
    const std::uint64_t second = u32(off + 4);
    return little_endian_ ? (second << 32) | first : (first << 32) | second;
  }

  [[nodiscard]] const unsigned char* at(std::size_t off) const { return base_ + off; }

 private:
  const unsigned char* base_;
  std::size_t size_;
  bool little_endian_;
};

ExifValue read_scalar(const TiffReader& r, std::uint16_t type, std::size_t off) {
  switch (type) {
    case kShort:
      return ExifValue(static_cast<std::int64_t>(r.u16(off)));
    case kSShort:
      return ExifValue(static_cast<std::int64_t>(static_cast<std::int16_t>(r.u16(off))));
    case kLong:
      return ExifValue(static_cast<std::int64_t>(r.u32(off)));
    case kSLong:
      return ExifValue(static_cast<std::int64_t>(static_cast<std::int32_t>(r.u32(off))));
    case kRational: {
      const std::uint32_t num = r.u32(off);
      const std::uint32_t den = r.u32(off + 4);
      return ExifValue(den == 0 ? 0.0 : static_cast<double>(num) / den);
    }
    case kSRational: {
      const auto num = static_cast<std::int32_t>(r.u32(off));
      const auto den = static_cast<std::int32_t>(r.u32(off + 4));
      return ExifValue(den == 0 ? 0.0 : static_cast<double>(num) / den);
    }
    case kFloat: {
      const std::uint32_t bits = r.u32(off);
      float f;
      std::memcpy(&f, &bits, sizeof(f));
      return ExifValue(static_cast<double>(f));
    }
    case kDouble: {
      const std::uint64_t bits = r.u64(off);
      double d;
      std::memcpy(&d, &bits, sizeof(d));
      return ExifValue(d);
    }
    default:
      return ExifValue(std::string{});
  }
}

struct IfdContext {
  const TiffReader& reader;
  const ExifDecodeLimits& limits;
  std::set<std::uint32_t> visited;
  std::uint64_t values = 0;
  std::uint64_t bytes = 0;
  bool exhausted = false;

  /// Charges value_count values and n payload bytes; false once a budget is spent.
  bool charge(std::uint64_t value_count, std::uint64_t n) {
    if (values + value_count > limits.max_total_values || bytes + n > limits.max_total_bytes) {
      exhausted = true;
      return false;
    }
    values += value_count;
    bytes += n;
    return true;
  }
};

std::optional<ExifValue> read_entry_value(IfdContext& ctx, std::size_t entry_off) {
  const TiffReader& r = ctx.reader;
  const std::uint16_t type = r.u16(entry_off + 2);
  const std::uint32_t count = r.u32(entry_off + 4);
  const std::size_t elem = type_size(type);
  if (elem == 0 || count == 0) return std::nullopt;

  const std::uint64_t total = static_cast<std::uint64_t>(elem) * count;
  std::size_t value_off = entry_off + 8;
  if (total > 4) {
    value_off = r.u32(entry_off + 8);
  }
  if (!r.in_bounds(value_off, static_cast<std::size_t>(total))) return std::nullopt;

  if (type == kAscii) {
    if (!ctx.charge(1, count)) return std::nullopt;
    std::string s(reinterpret_cast<const char*>(r.at(value_off)), count);
    while (!s.empty() && s.back() == '\0') s.pop_back();
    return ExifValue(std::move(s));
  }
  if (type == kByte || type == kSByte || type == kUndefined) {
    if (!ctx.charge(1, count)) return std::nullopt;
    const auto* p = reinterpret_cast<const std::byte*>(r.at(value_off));
    return ExifValue(ExifBytes{std::vector<std::byte>(p, p + count)});
  }
  if (count > ctx.limits.max_elements_per_tag) return std::nullopt;
  if (!ctx.charge(count, 0)) return std::nullopt;
  if (count == 1) {
    return read_scalar(r, type, value_off);
  }
  ExifMap items;
  for (std::uint32_t i = 0; i < count; ++i) {
    items.emplace(std::to_string(i), read_scalar(r, type, value_off + i * elem));
  }
  return ExifValue(std::move(items));
}

void parse_ifd(IfdContext& ctx, std::uint32_t offset, bool gps, ExifMap& out) {
  const TiffReader& r = ctx.reader;
  if (ctx.visited.size() >= ctx.limits.max_ifds) return;
  if (!ctx.visited.insert(offset).second) return;  // IFD loop
  if (!r.in_bounds(offset, 2)) return;

  const std::uint32_t num_entries = std::min<std::uint32_t>(r.u16(offset), ctx.limits.max_entries_per_ifd);
  for (std::uint32_t i = 0; i < num_entries && !ctx.exhausted; ++i) {
    const std::size_t entry_off = static_cast<std::size_t>(offset) + 2 + static_cast<std::size_t>(i) * 12;
    if (!r.in_bounds(entry_off, 12)) return;

    const std::uint16_t tag = r.u16(entry_off);
    if (!gps && tag == kExifIfdPointer) {
      parse_ifd(ctx, r.u32(entry_off + 8), false, out);
      continue;
    }
    if (!gps && tag == kGpsIfdPointer) {
      ExifMap gps_map;
      parse_ifd(ctx, r.u32(entry_off + 8), true, gps_map);
      out.insert_or_assign("GPSInfo", ExifValue(std::move(gps_map)));
      continue;
    }
    if (!gps && tag == kInteropIfdPointer) continue;

    auto value = read_entry_value(ctx, entry_off);
    if (!value) continue;

    std::optional<std::string> name = gps ? gps_tag_name(tag) : exif_tag_name(tag);
    out.insert_or_assign(name ? *name : std::to_string(tag), std::move(*value));
  }
}

std::uint32_t read_be32(const unsigned char* p) {
  return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

std::span<const std::byte> find_in_jpeg(std::span<const std::byte> image) {
  const auto* p = reinterpret_cast<const unsigned char*>(image.data());
  const std::size_t n = image.size();
  std::size_t pos = 2;
  while (pos + 4 <= n) {
    if (p[pos] != 0xFF) break;
    const unsigned char marker = p[pos + 1];
    if (marker == 0xD9 || marker == 0xDA) break;  // EOI / SOS: no metadata past here
    const std::size_t length = (static_cast<std::size_t>(p[pos + 2]) << 8) | p[pos + 3];
    if (length < 2 || pos + 2 + length > n) break;

    if (marker == 0xE1 && length >= 8 && std::memcmp(p + pos + 4, "Exif\0\0", 6) == 0) {
      return image.subspan(pos + 10, length - 8);
    }
    pos += 2 + length;
  }
  return {};
}

std::span<const std::byte> find_in_png(std::span<const std::byte> image) {
  const auto* p = reinterpret_cast<const unsigned char*>(image.data());
  const std::size_t n = image.size();
  std::size_t pos = 8;
  while (pos + 12 <= n) {
    const std::size_t length = read_be32(p + pos);
    if (length > n - pos - 12) break;
    const unsigned char* type = p + pos + 4;
    if (std::memcmp(type, "eXIf", 4) == 0) {
      return image.subspan(pos + 8, length);
    }
    if (std::memcmp(type, "IEND", 4) == 0) break;
    pos += 12 + length;
  }
  return {};
}

}  // namespace

std::optional<std::string> exif_tag_name(std::uint16_t tag) {
  return lookup(kExifTags, tag);
}

std::optional<std::string> gps_tag_name(std::uint16_t tag) {
  return lookup(kGpsTags, tag);
}

std::span<const std::byte> find_exif_block(std::span<const std::byte> image) {
  const auto* p = reinterpret_cast<const unsigned char*>(image.data());
  if (image.size() >= 8 && p[0] == 0x89 && std::memcmp(p + 1, "PNG", 3) == 0) {
    return find_in_png(image);
  }
  if (image.size() >= 4 && p[0] == 0xFF && p[1] == 0xD8) {
    return find_in_jpeg(image);
  }
  return {};
}

core::ExifMap parse_exif_tiff(std::span<const std::byte> tiff, const ExifDecodeLimits& limits) {
  ExifMap out;
  const auto* p = reinterpret_cast<const unsigned char*>(tiff.data());
  if (tiff.size() < 8) return out;

  bool little_endian = false;
  if (p[0] == 'I' && p[1] == 'I') {
    little_endian = true;
  } else if (!(p[0] == 'M' && p[1] == 'M')) {
    return out;
  }

  TiffReader reader(p, tiff.size(), little_endian);
  if (reader.u16(2) != 42) return out;

  IfdContext ctx{reader, limits};
  parse_ifd(ctx, reader.u32(4), false, out);
  return out;
}

core::ExifMap extract_exif(std::span<const std::byte> image, const ExifDecodeLimits& limits) {
  return parse_exif_tiff(find_exif_block(image), limits);
}

}  // namespace imgpipe::vision
