#include <imgpipe/core/frame.hpp>

namespace imgpipe::core {

std::uint32_t channel_count(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8: return 1;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8: return 3;
    case PixelFormat::BGRA8: return 4;
    case PixelFormat::Unknown: break;
  }
  return 0;
}

std::size_t Frame::required_bytes(std::uint32_t width, std::uint32_t height, PixelFormat format) noexcept {
  return static_cast<std::size_t>(width) * height * channel_count(format);
}

Frame Frame::blank(std::uint32_t width, std::uint32_t height, PixelFormat format) {
  return Frame(width, height, format, std::vector<std::byte>(required_bytes(width, height, format)));
}

bool Frame::well_formed() const noexcept {
  return channels() > 0 && width_ > 0 && height_ > 0 &&
         pixels_.size() >= required_bytes(width_, height_, format_);
}

}  // namespace imgpipe::core
