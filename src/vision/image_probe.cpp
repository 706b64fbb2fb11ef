#include <imgpipe/vision/image_probe.hpp>
#include <array>
#include <cstring>

namespace imgpipe::vision {

namespace {

constexpr std::array<unsigned char, 8> kPngSignature{0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

std::uint32_t read_be32(const unsigned char* p) {
  return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

std::uint16_t read_be16(const unsigned char* p) {
  return static_cast<std::uint16_t>((p[0] << 8) | p[1]);
}

std::optional<ImageHeader> probe_png(const unsigned char* p, std::size_t n) {
  // signature(8) + chunk length(4) + "IHDR"(4) + width(4) + height(4)
  if (n < 24) return std::nullopt;
  if (std::memcmp(p + 12, "IHDR", 4) != 0) return std::nullopt;
  ImageHeader h;
  h.format = ImageFormat::Png;
  h.width = read_be32(p + 16);
  h.height = read_be32(p + 20);
  if (h.width == 0 || h.height == 0) return std::nullopt;
  return h;
}

bool is_sof_marker(unsigned char m) {
  // SOF0..SOF15 excluding DHT (C4), JPG (C8) and DAC (CC)
  return m >= 0xC0 && m <= 0xCF && m != 0xC4 && m != 0xC8 && m != 0xCC;
}

std::optional<ImageHeader> probe_jpeg(const unsigned char* p, std::size_t n) {
  std::size_t pos = 2;
  while (pos + 4 <= n) {
    if (p[pos] != 0xFF) return std::nullopt;
    const unsigned char marker = p[pos + 1];
    if (marker == 0xFF) {  // fill byte
      ++pos;
      continue;
    }
    if (marker == 0xD8 || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
      pos += 2;  // standalone markers carry no length
      continue;
    }
    if (marker == 0xD9 || marker == 0xDA) return std::nullopt;  // EOI / SOS before any SOF

    const std::size_t length = read_be16(p + pos + 2);
    if (length < 2 || pos + 2 + length > n) return std::nullopt;

    if (is_sof_marker(marker)) {
      // length(2) precision(1) height(2) width(2)
      if (length < 7) return std::nullopt;
      ImageHeader h;
      h.format = ImageFormat::Jpeg;
      h.height = read_be16(p + pos + 5);
      h.width = read_be16(p + pos + 7);
      if (h.width == 0 || h.height == 0) return std::nullopt;
      return h;
    }
    pos += 2 + length;
  }
  return std::nullopt;
}

}  // namespace

std::string_view format_name(ImageFormat format) noexcept {
  switch (format) {
    case ImageFormat::Png:
      return "png";
    case ImageFormat::Jpeg:
      return "jpeg";
    case ImageFormat::Unknown:
    default:
      return "";
  }
}

std::optional<ImageHeader> probe_image_header(std::span<const std::byte> data) {
  const auto* p = reinterpret_cast<const unsigned char*>(data.data());
  const std::size_t n = data.size();

  if (n >= kPngSignature.size() && std::memcmp(p, kPngSignature.data(), kPngSignature.size()) == 0) {
    return probe_png(p, n);
  }
  if (n >= 3 && p[0] == 0xFF && p[1] == 0xD8 && p[2] == 0xFF) {
    return probe_jpeg(p, n);
  }
  return std::nullopt;
}

}  // namespace imgpipe::vision
