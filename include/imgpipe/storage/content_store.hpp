#pragma once

#include <imgpipe/core/error.hpp>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace imgpipe::storage {

/// Filesystem store for uploaded originals and generated thumbnails.
///
/// Layout under root:
///   originals/<random id><ext>             one file per upload attempt
///   thumbnails/<variant>/<sha256>.jpeg     one file per content hash and size
///
/// Every write goes to a temporary file in the target directory and is
/// renamed into place, so a path handed out by store() always names a
/// complete file. On failure the temporary file is removed.
class ContentStore {
 public:
  explicit ContentStore(std::filesystem::path root);

  [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

  /// Writes bytes under a fresh random name keeping the extension of
  /// suggested_name (lowercased). Returns the stored path.
  [[nodiscard]] std::expected<std::string, core::StorageError>
  store(std::span<const std::byte> bytes, std::string_view suggested_name);

  [[nodiscard]] std::expected<std::vector<std::byte>, core::StorageError>
  read(const std::string& path) const;

  [[nodiscard]] bool exists(const std::string& path) const;

  /// Deletes a stored file. Returns false if nothing was removed.
  bool remove(const std::string& path);

  /// Binary input stream over a stored file.
  [[nodiscard]] std::expected<std::ifstream, core::StorageError>
  open(const std::string& path) const;

  /// Deterministic thumbnail location; the file may not exist yet.
  [[nodiscard]] std::filesystem::path thumbnail_path(std::string_view content_hash,
                                                     std::string_view variant) const;

  /// Atomically (re)writes a thumbnail. Returns its path.
  [[nodiscard]] std::expected<std::string, core::StorageError>
  write_thumbnail(std::string_view content_hash,
                  std::string_view variant,
                  std::span<const std::byte> jpeg);

 private:
  std::filesystem::path root_;
};

/// Removes a freshly stored file on scope exit unless commit() was called,
/// so a failure after store() leaves no unreferenced original behind.
class StoredFileGuard {
 public:
  StoredFileGuard(ContentStore& store, std::string path) : store_(store), path_(std::move(path)) {}
  ~StoredFileGuard();

  StoredFileGuard(const StoredFileGuard&) = delete;
  StoredFileGuard& operator=(const StoredFileGuard&) = delete;

  void commit() noexcept { committed_ = true; }

 private:
  ContentStore& store_;
  std::string path_;
  bool committed_{false};
};

}  // namespace imgpipe::storage
