#include <imgpipe/storage/content_store.hpp>
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace fs = std::filesystem;
namespace ic = imgpipe::core;
namespace is = imgpipe::storage;
namespace it = imgpipe::test;

namespace {

std::size_t files_in(const fs::path& dir) {
  if (!fs::exists(dir)) return 0;
  return static_cast<std::size_t>(std::distance(fs::directory_iterator(dir), fs::directory_iterator{}));
}

}  // namespace

TEST(ContentStore, StoreThenReadBack) {
  it::TempDir dir;
  is::ContentStore store(dir.path());
  const auto bytes = it::make_png(12, 12);

  auto path = store.store(bytes, "Holiday.PNG");
  ASSERT_TRUE(path.has_value());
  EXPECT_TRUE(store.exists(*path));
  EXPECT_EQ(fs::path(*path).extension(), ".png");
  EXPECT_EQ(fs::path(*path).parent_path(), dir.path() / "originals");

  auto back = store.read(*path);
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(*back, bytes);
}

TEST(ContentStore, IdenticalBytesGetDistinctStoredCopies) {
  it::TempDir dir;
  is::ContentStore store(dir.path());
  const auto bytes = it::to_bytes("same");
  auto a = store.store(bytes, "a.jpg");
  auto b = store.store(bytes, "a.jpg");
  ASSERT_TRUE(a && b);
  EXPECT_NE(*a, *b);
  EXPECT_EQ(files_in(dir.path() / "originals"), 2u);
}

TEST(ContentStore, OpenReturnsBinaryStream) {
  it::TempDir dir;
  is::ContentStore store(dir.path());
  auto path = store.store(it::to_bytes("\x01\x02\x03"), "x.png");
  ASSERT_TRUE(path.has_value());
  auto in = store.open(*path);
  ASSERT_TRUE(in.has_value());
  char buf[3] = {};
  in->read(buf, 3);
  EXPECT_EQ(in->gcount(), 3);
  EXPECT_EQ(buf[2], '\x03');
}

TEST(ContentStore, MissingFileIsNotFound) {
  it::TempDir dir;
  is::ContentStore store(dir.path());
  const std::string missing = dir.file("originals/nope.png");
  EXPECT_FALSE(store.exists(missing));
  EXPECT_EQ(store.read(missing).error(), ic::StorageError::NotFound);
  EXPECT_EQ(store.open(missing).error(), ic::StorageError::NotFound);
}

TEST(ContentStore, ThumbnailPathIsDeterministic) {
  it::TempDir dir;
  is::ContentStore store(dir.path());
  EXPECT_EQ(store.thumbnail_path("abc", "small"), dir.path() / "thumbnails" / "small" / "abc.jpeg");

  auto written = store.write_thumbnail("abc", "small", it::to_bytes("jpeg"));
  ASSERT_TRUE(written.has_value());
  EXPECT_EQ(fs::path(*written), store.thumbnail_path("abc", "small"));
  EXPECT_TRUE(store.exists(*written));

  // Rewrite replaces in place.
  ASSERT_TRUE(store.write_thumbnail("abc", "small", it::to_bytes("jpeg2")).has_value());
  EXPECT_EQ(store.read(*written)->size(), 5u);
  EXPECT_EQ(files_in(dir.path() / "thumbnails" / "small"), 1u);
}

TEST(ContentStore, FailedWriteLeavesNoFileBehind) {
  it::TempDir dir;
  // A regular file where the originals directory should be.
  {
    std::ofstream blocker(dir.path() / "originals");
    blocker << "x";
  }
  is::ContentStore store(dir.path());
  auto path = store.store(it::to_bytes("data"), "a.png");
  ASSERT_FALSE(path.has_value());
  EXPECT_EQ(path.error(), ic::StorageError::CreateDirectoryFailed);
  EXPECT_TRUE(fs::is_regular_file(dir.path() / "originals"));
}

TEST(ContentStore, RemoveDeletesStoredFile) {
  it::TempDir dir;
  is::ContentStore store(dir.path());
  auto path = store.store(it::to_bytes("gone soon"), "x.png");
  ASSERT_TRUE(path.has_value());
  EXPECT_TRUE(store.remove(*path));
  EXPECT_FALSE(store.exists(*path));
  EXPECT_FALSE(store.remove(*path));
}

TEST(StoredFileGuard, UncommittedGuardDiscardsFile) {
  it::TempDir dir;
  is::ContentStore store(dir.path());
  auto path = store.store(it::make_png(4, 4), "a.png");
  ASSERT_TRUE(path.has_value());
  {
    is::StoredFileGuard guard(store, *path);
  }
  EXPECT_FALSE(store.exists(*path));
  EXPECT_EQ(files_in(dir.path() / "originals"), 0u);
}

TEST(StoredFileGuard, CommittedGuardKeepsFile) {
  it::TempDir dir;
  is::ContentStore store(dir.path());
  auto path = store.store(it::make_png(4, 4), "a.png");
  ASSERT_TRUE(path.has_value());
  {
    is::StoredFileGuard guard(store, *path);
    guard.commit();
  }
  EXPECT_TRUE(store.exists(*path));
}

TEST(StoredFileGuard, DiscardsFileWhenExceptionUnwinds) {
  it::TempDir dir;
  is::ContentStore store(dir.path());
  auto path = store.store(it::make_png(4, 4), "a.png");
  ASSERT_TRUE(path.has_value());
  EXPECT_THROW(
      {
        is::StoredFileGuard guard(store, *path);
        throw std::runtime_error("ledger: step failed: database is locked");
      },
      std::runtime_error);
  EXPECT_FALSE(store.exists(*path));
}
