#include <imgpipe/vision/thumbnailer.hpp>

namespace imgpipe::vision {

std::vector<ThumbnailVariant> default_thumbnail_variants() {
  return {{"small", 256}, {"medium", 768}};
}

std::expected<std::vector<std::byte>, ImageOpError>
make_thumbnail(const core::Frame& decoded, std::uint32_t max_edge, int quality) {
  auto bgr = convert_color(decoded, core::PixelFormat::BGR8);
  if (!bgr) return std::unexpected(bgr.error());

  auto scaled = fit_within(*bgr, max_edge);
  if (!scaled) return std::unexpected(scaled.error());

  return encode_jpeg(*scaled, quality);
}

}  // namespace imgpipe::vision
