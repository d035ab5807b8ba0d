#include <gtest/gtest.h>

#include <unistd.h>

#include "core/scan/DirectoryScanner.hpp"
#include "TestSupport.hpp"

using namespace safs;
namespace fs = std::filesystem;

class DirectoryScannerTest : public ::testing::Test {
protected:
  test::TempDir root;
};

TEST_F(DirectoryScannerTest, YieldsDirectoriesWithMetadataInSortedDepthFirstOrder) {
  test::write_file(root / "root.csv", "filename\n");
  test::write_file(root / "b/deep/nested/m.CSV", "filename\n");
  test::write_file(root / "a/m.csv", "filename\n");
  test::write_file(root / "a/x.pdf", "%PDF");
  test::write_file(root / "a/Y.PDF", "%PDF");
  test::write_file(root / "a/notes.txt", "n");
  test::write_file(root / "c/only.pdf", "%PDF");

  auto entries = scan_all(root.path());
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0].relativePath, fs::path("."));
  EXPECT_EQ(entries[1].relativePath, fs::path("a"));
  EXPECT_EQ(entries[2].relativePath, fs::path("b/deep/nested"));

  ASSERT_EQ(entries[1].documentFiles.size(), 2u);
  EXPECT_EQ(entries[1].documentFiles[0].filename(), "Y.PDF");
  EXPECT_EQ(entries[1].documentFiles[1].filename(), "x.pdf");
}

TEST_F(DirectoryScannerTest, SkipsHiddenAndOutputDirectories) {
  test::write_file(root / ".cache/m.csv", "filename\n");
  test::write_file(root / "src/m.csv", "filename\n");
  test::write_file(root / "src/SimpleArchiveFormat/item_000/m.csv", "filename\n");

  auto entries = scan_all(root.path());
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].relativePath, fs::path("src"));
}

TEST_F(DirectoryScannerTest, NonRecursiveScanOnlyLooksAtRoot) {
  test::write_file(root / "m.csv", "filename\n");
  test::write_file(root / "sub/m.csv", "filename\n");
  ScanOptions opts;
  opts.recursive = false;
  EXPECT_EQ(scan_all(root.path(), opts).size(), 1u);
}

TEST_F(DirectoryScannerTest, UnreadableDirectoryIsRecordedAndScanContinues) {
  if (::geteuid() == 0) GTEST_SKIP() << "permission checks do not apply to root";
  test::write_file(root / "locked/m.csv", "filename\n");
  test::write_file(root / "open/m.csv", "filename\n");
  fs::permissions(root / "locked", fs::perms::none);

  std::vector<ScanError> errors;
  auto entries = scan_all(root.path(), {}, &errors);
  fs::permissions(root / "locked", fs::perms::owner_all);

  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].relativePath, fs::path("open"));
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_TRUE(errors[0].accessDenied);
}

TEST(HasExtensionTest, CaseInsensitive) {
  EXPECT_TRUE(has_extension("a/B.PdF", {".pdf"}));
  EXPECT_FALSE(has_extension("a/b.pdf.txt", {".pdf"}));
  EXPECT_FALSE(has_extension("a/pdf", {".pdf"}));
}
