#pragma once

#include <imgpipe/core/error.hpp>
#include <imgpipe/core/frame.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace imgpipe::vision {

/// Abstract caption model: decoded image -> one line of text.
/// Implementations must tolerate concurrent caption() calls.
class ICaptionModel {
 public:
  virtual ~ICaptionModel() = default;

  [[nodiscard]] virtual std::expected<std::string, core::JobError>
  caption(const core::Frame& image) = 0;

  /// Optional: one dummy inference so the first real request is not slow. Default: no-op.
  virtual void warmup() {}
};

/// Process-scoped owner of the caption model. The model is built by the
/// factory on first acquire() (or warmup()) and shared by every caption job
/// until release(). Jobs hold a shared_ptr, so release() never pulls the
/// model out from under an in-flight caption.
class CaptionModelManager {
 public:
  using Factory = std::function<std::unique_ptr<ICaptionModel>()>;

  explicit CaptionModelManager(Factory factory);

  CaptionModelManager(const CaptionModelManager&) = delete;
  CaptionModelManager& operator=(const CaptionModelManager&) = delete;

  /// Returns the model, building it on first use. Factory exceptions propagate.
  [[nodiscard]] std::shared_ptr<ICaptionModel> acquire();

  /// acquire() followed by the model's warmup().
  void warmup();

  /// Drops the manager's reference; the next acquire() builds a fresh model.
  void release();

  [[nodiscard]] bool loaded() const;

 private:
  Factory factory_;
  mutable std::mutex mutex_;
  std::shared_ptr<ICaptionModel> model_;
};

}  // namespace imgpipe::vision
