#pragma once

#ifdef IMGPIPE_HAS_ONNXRUNTIME

#include <imgpipe/core/error.hpp>
#include <imgpipe/core/frame.hpp>
#include <imgpipe/vision/caption_model.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace imgpipe::vision {

/// ONNX Runtime caption model: an image-to-text graph exported with its
/// decoding loop baked in.
///
/// Expected model: one float input [1, 3, H, W] (RGB, scaled to [0, 1] then
/// normalised with the CLIP mean/std used by BLIP) and one int64 output
/// [1, T] holding generated token ids. H and W are read from the model; a
/// dynamic spatial dimension falls back to 384.
///
/// The vocabulary file has one WordPiece token per line; line number = token
/// id. Special tokens ([PAD], [CLS], [SEP], [UNK], [MASK]) are skipped and
/// "##" continuations are glued to the previous word.
class OnnxCaptionModel : public ICaptionModel {
 public:
  /// \param model_path Path to the .onnx file. Throws Ort::Exception if unreadable.
  /// \param vocab_path Vocabulary file. Throws std::runtime_error if unreadable or empty.
  OnnxCaptionModel(std::string model_path, std::string vocab_path);

  ~OnnxCaptionModel() override;

  OnnxCaptionModel(const OnnxCaptionModel&) = delete;
  OnnxCaptionModel& operator=(const OnnxCaptionModel&) = delete;

  [[nodiscard]] std::expected<std::string, core::JobError>
  caption(const core::Frame& image) override;

  void warmup() override;

  [[nodiscard]] std::uint32_t input_width() const noexcept;
  [[nodiscard]] std::uint32_t input_height() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace imgpipe::vision

#endif  // IMGPIPE_HAS_ONNXRUNTIME
