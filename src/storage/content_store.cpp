#include <imgpipe/storage/content_store.hpp>
#include <imgpipe/core/digest.hpp>
#include <imgpipe/vision/validator.hpp>
#include <spdlog/spdlog.h>
#include <system_error>

namespace imgpipe::storage {

namespace fs = std::filesystem;
using core::StorageError;

namespace {

/// Write to "<dir>/.tmp-<rand>" then rename onto target.
std::expected<void, StorageError> write_atomically(const fs::path& target,
                                                   std::span<const std::byte> bytes) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec || !fs::is_directory(target.parent_path(), ec)) {
    return std::unexpected(StorageError::CreateDirectoryFailed);
  }

  const fs::path tmp = target.parent_path() / (".tmp-" + core::random_id(8));
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    if (!os) {
      return std::unexpected(StorageError::WriteFailed);
    }
    os.write(reinterpret_cast<const char*>(bytes.data()),
             static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) {
      os.close();
      fs::remove(tmp, ec);
      return std::unexpected(StorageError::WriteFailed);
    }
  }

  fs::rename(tmp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return std::unexpected(StorageError::RenameFailed);
  }
  return {};
}

}  // namespace

ContentStore::ContentStore(fs::path root) : root_(std::move(root)) {}

std::expected<std::string, StorageError>
ContentStore::store(std::span<const std::byte> bytes, std::string_view suggested_name) {
  const fs::path target =
      root_ / "originals" / (core::random_id() + vision::lowercase_extension(suggested_name));
  auto written = write_atomically(target, bytes);
  if (!written) {
    return std::unexpected(written.error());
  }
  return target.string();
}

std::expected<std::vector<std::byte>, StorageError>
ContentStore::read(const std::string& path) const {
  auto in = open(path);
  if (!in) {
    return std::unexpected(in.error());
  }
  std::error_code ec;
  const auto size = fs::file_size(path, ec);
  if (ec) {
    return std::unexpected(StorageError::ReadFailed);
  }
  std::vector<std::byte> out(static_cast<std::size_t>(size));
  in->read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
  if (static_cast<std::uintmax_t>(in->gcount()) != size) {
    return std::unexpected(StorageError::ReadFailed);
  }
  return out;
}

bool ContentStore::exists(const std::string& path) const {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

bool ContentStore::remove(const std::string& path) {
  std::error_code ec;
  return fs::remove(path, ec) && !ec;
}

StoredFileGuard::~StoredFileGuard() {
  if (committed_) return;
  if (store_.remove(path_)) {
    spdlog::warn("stored_file_discarded path={}", path_);
  } else {
    spdlog::error("stored_file_discard_failed path={}", path_);
  }
}

std::expected<std::ifstream, StorageError> ContentStore::open(const std::string& path) const {
  if (!exists(path)) {
    return std::unexpected(StorageError::NotFound);
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::unexpected(StorageError::ReadFailed);
  }
  return in;
}

fs::path ContentStore::thumbnail_path(std::string_view content_hash,
                                      std::string_view variant) const {
  return root_ / "thumbnails" / std::string(variant) / (std::string(content_hash) + ".jpeg");
}

std::expected<std::string, StorageError>
ContentStore::write_thumbnail(std::string_view content_hash,
                              std::string_view variant,
                              std::span<const std::byte> jpeg) {
  const fs::path target = thumbnail_path(content_hash, variant);
  auto written = write_atomically(target, jpeg);
  if (!written) {
    return std::unexpected(written.error());
  }
  return target.string();
}

}  // namespace imgpipe::storage
