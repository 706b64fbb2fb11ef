#include <imgpipe/vision/caption_model.hpp>
#include <stdexcept>

namespace imgpipe::vision {

CaptionModelManager::CaptionModelManager(Factory factory)
    : factory_(std::move(factory)) {
  if (!factory_) {
    throw std::invalid_argument("CaptionModelManager: factory must not be empty");
  }
}

std::shared_ptr<ICaptionModel> CaptionModelManager::acquire() {
  std::lock_guard lock(mutex_);
  if (!model_) {
    std::unique_ptr<ICaptionModel> built = factory_();
    if (!built) {
      throw std::runtime_error("CaptionModelManager: factory returned no model");
    }
    model_ = std::move(built);
  }
  return model_;
}

void CaptionModelManager::warmup() {
  acquire()->warmup();
}

void CaptionModelManager::release() {
  std::lock_guard lock(mutex_);
  model_.reset();
}

bool CaptionModelManager::loaded() const {
  std::lock_guard lock(mutex_);
  return model_ != nullptr;
}

}  // namespace imgpipe::vision
