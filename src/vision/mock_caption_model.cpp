#include <imgpipe/vision/mock_caption_model.hpp>

namespace imgpipe::vision {

MockCaptionModel::MockCaptionModel(std::string caption)
    : caption_(std::move(caption)) {}

void MockCaptionModel::set_caption(std::string caption) {
  std::lock_guard lock(mutex_);
  caption_ = std::move(caption);
}

void MockCaptionModel::set_failure(std::optional<core::JobError> error) {
  std::lock_guard lock(mutex_);
  failure_ = error;
}

std::expected<std::string, core::JobError>
MockCaptionModel::caption(const core::Frame& image) {
  std::lock_guard lock(mutex_);
  ++caption_calls_;
  last_longest_edge_ = image.longest_edge();
  if (image.empty()) {
    return std::unexpected(core::JobError::DecodeFailed);
  }
  if (failure_) {
    return std::unexpected(*failure_);
  }
  return caption_;
}

void MockCaptionModel::warmup() {
  std::lock_guard lock(mutex_);
  ++warmup_calls_;
}

std::size_t MockCaptionModel::caption_calls() const {
  std::lock_guard lock(mutex_);
  return caption_calls_;
}

std::size_t MockCaptionModel::warmup_calls() const {
  std::lock_guard lock(mutex_);
  return warmup_calls_;
}

std::uint32_t MockCaptionModel::last_longest_edge() const {
  std::lock_guard lock(mutex_);
  return last_longest_edge_;
}

}  // namespace imgpipe::vision
