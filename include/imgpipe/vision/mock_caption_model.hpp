#pragma once

#include <imgpipe/vision/caption_model.hpp>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace imgpipe::vision {

/// Caption model returning a configurable fixed caption (for tests/demo).
class MockCaptionModel : public ICaptionModel {
 public:
  explicit MockCaptionModel(std::string caption = "a photo");

  /// Caption to return on subsequent calls.
  void set_caption(std::string caption);

  /// When set, caption() fails with this error instead.
  void set_failure(std::optional<core::JobError> error);

  [[nodiscard]] std::expected<std::string, core::JobError>
  caption(const core::Frame& image) override;

  void warmup() override;

  [[nodiscard]] std::size_t caption_calls() const;
  [[nodiscard]] std::size_t warmup_calls() const;
  /// Longest edge of the most recent frame passed to caption().
  [[nodiscard]] std::uint32_t last_longest_edge() const;

 private:
  mutable std::mutex mutex_;
  std::string caption_;
  std::optional<core::JobError> failure_;
  std::size_t caption_calls_{0};
  std::size_t warmup_calls_{0};
  std::uint32_t last_longest_edge_{0};
};

}  // namespace imgpipe::vision
