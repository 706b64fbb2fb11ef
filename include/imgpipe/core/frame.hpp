#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace imgpipe::core {

/// Interleaved 8-bit layout of a decoded image.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  BGRA8,
};

/// Channels per pixel; 0 for Unknown.
[[nodiscard]] std::uint32_t channel_count(PixelFormat format) noexcept;

/// A decoded image held in memory between the decoder and the jobs that
/// consume it (thumbnailer, caption model). Rows are tightly packed, so
/// row_bytes() == width * channels. No OpenCV type appears here; the
/// vision layer wraps the buffer when it needs a cv::Mat.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> pixels)
      : width_(width),
        height_(height),
        format_(format),
        pixels_(std::move(pixels)) {}

  /// Zero-filled image of the given size.
  [[nodiscard]] static Frame blank(std::uint32_t width, std::uint32_t height, PixelFormat format);

  /// Buffer size a frame of these dimensions must carry.
  [[nodiscard]] static std::size_t required_bytes(std::uint32_t width,
                                                  std::uint32_t height,
                                                  PixelFormat format) noexcept;

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }
  [[nodiscard]] std::uint32_t channels() const noexcept { return channel_count(format_); }
  [[nodiscard]] std::size_t row_bytes() const noexcept {
    return static_cast<std::size_t>(width_) * channels();
  }
  [[nodiscard]] std::uint32_t longest_edge() const noexcept {
    return width_ > height_ ? width_ : height_;
  }

  [[nodiscard]] std::span<const std::byte> data() const noexcept { return pixels_; }
  [[nodiscard]] std::span<std::byte> data() noexcept { return pixels_; }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return pixels_.size(); }
  [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }

  /// Known format, non-zero size and a buffer at least required_bytes() long.
  [[nodiscard]] bool well_formed() const noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> pixels_;
};

}  // namespace imgpipe::core
