#include <gtest/gtest.h>

#include <algorithm>

#include "core/errors/Errors.hpp"
#include "core/session/InitDb.hpp"
#include "core/session/SessionStore.hpp"
#include "core/upload/TreeUploader.hpp"
#include "TestSupport.hpp"

using namespace safs;

class TreeUploaderTest : public ::testing::Test {
protected:
  void SetUp() override {
    const auto db = (dir / "state/sessions.db").string();
    initDatabase(db, SAFS_SCHEMA_FILE);
    sessions = std::make_unique<SessionStore>(db);
    retry.maxAttempts = 2;
    retry.jitter = 0.0;
    opts.segmentThreshold = 8;
    opts.chunkSize = 4;
    pipeline = std::make_unique<UploadPipeline>(store, *sessions, opts, retry, &sleeper);

    root = dir / "out/batch1";
    test::write_file(root / "item_000/contents", "doc.pdf\n");
    test::write_file(root / "item_000/dublin_core.xml", "<dublin_core/>");
    test::write_file(root / "item_000/doc.pdf", test::payload(30));
    test::write_file(root / "item_000/manifest", "dublin_core.xml\ndoc.pdf\n");
    test::write_file(root / "item_000/scratch.txt", "not listed");
    test::write_file(root / "batch_report.json", "{}");
    test::write_file(root / ".hidden", "x");
    test::write_file(root / ".item_001.partial/contents", "partial");
  }

  test::TempDir dir;
  std::unique_ptr<SessionStore> sessions;
  test::FakeObjectStore store;
  test::FakeSleeper sleeper;
  RetryPolicy retry;
  UploadOptions opts;
  std::unique_ptr<UploadPipeline> pipeline;
  std::filesystem::path root;
};

TEST_F(TreeUploaderTest, ObjectNamesKeepTheTopFolder) {
  EXPECT_EQ(TreeUploader::objectNameFor("/data/out/batch1", "/data/out/batch1/item_000/contents"),
            "batch1/item_000/contents");
  EXPECT_EQ(TreeUploader::objectNameFor("/data/out/batch1/", "/data/out/batch1/a.pdf"), "batch1/a.pdf");
}

TEST_F(TreeUploaderTest, CollectSkipsHiddenFilesAndStagingDirectories) {
  TreeUploader up(*pipeline);
  const auto files = up.collect(root).files;
  ASSERT_EQ(files.size(), 5u);
  for (const auto& f : files) {
    const auto name = TreeUploader::objectNameFor(root, f);
    EXPECT_EQ(name.find(".partial"), std::string::npos) << name;
    EXPECT_EQ(name.find(".hidden"), std::string::npos) << name;
  }
  EXPECT_TRUE(std::is_sorted(files.begin(), files.end()));
}

TEST_F(TreeUploaderTest, PackageDirectoriesSendOnlyManifestFiles) {
  TreeUploader up(*pipeline);
  const auto listing = up.collect(root);
  EXPECT_TRUE(listing.incompletePackages.empty());
  std::vector<std::string> names;
  for (const auto& f : listing.files) names.push_back(TreeUploader::objectNameFor(root, f));
  EXPECT_EQ(names, (std::vector<std::string>{
    "batch1/batch_report.json", "batch1/item_000/contents", "batch1/item_000/doc.pdf",
    "batch1/item_000/dublin_core.xml", "batch1/item_000/manifest"}));
}

TEST_F(TreeUploaderTest, StagingDirectoriesSkippedEvenWithHiddenFiles) {
  TreeUploader up(*pipeline, false);
  const auto files = up.collect(root).files;
  ASSERT_EQ(files.size(), 6u);
  for (const auto& f : files) EXPECT_EQ(f.string().find(".partial"), std::string::npos);
}

TEST_F(TreeUploaderTest, IncompletePackagesAreReportedAsFailed) {
  test::write_file(root / "item_001/contents", "b.pdf\n");
  test::write_file(root / "item_001/dublin_core.xml", "<dublin_core/>");
  test::write_file(root / "item_001/b.pdf", "bytes");
  test::write_file(root / "item_002/manifest", "dublin_core.xml\nc.pdf\n");
  test::write_file(root / "item_002/contents", "c.pdf\n");
  test::write_file(root / "item_002/c.pdf", "bytes");

  TreeUploader up(*pipeline);
  const auto listing = up.collect(root);
  ASSERT_EQ(listing.incompletePackages.size(), 2u);
  EXPECT_EQ(listing.incompletePackages[0], root / "item_001");
  EXPECT_EQ(listing.incompletePackages[1], root / "item_002");
  EXPECT_EQ(listing.files.size(), 5u);

  auto report = up.uploadDirectory(root, "repo");
  EXPECT_FALSE(report.ok());
  EXPECT_FALSE(report.aborted);
  EXPECT_EQ(report.total, 7u);
  EXPECT_EQ(report.succeeded, 5u);
  ASSERT_EQ(report.results.size(), 7u);
  EXPECT_EQ(report.results[0].objectKey, "batch1/item_001");
  EXPECT_EQ(report.results[0].status, FileUploadStatus::Failed);
  EXPECT_EQ(report.results[1].objectKey, "batch1/item_002");
  EXPECT_FALSE(store.has("repo", "batch1/item_001/b.pdf"));
  EXPECT_FALSE(store.has("repo", "batch1/item_002/c.pdf"));
}

TEST_F(TreeUploaderTest, SinglePackageDirectoryUploadsItsManifestFiles) {
  TreeUploader up(*pipeline);
  const auto listing = up.collect(root / "item_000");
  EXPECT_EQ(listing.files.size(), 4u);
  for (const auto& f : listing.files) EXPECT_NE(f.filename(), "scratch.txt");
}

TEST_F(TreeUploaderTest, CollectRejectsMissingDirectory) {
  TreeUploader up(*pipeline);
  EXPECT_THROW(up.collect(dir / "nope"), FilesystemError);
}

TEST_F(TreeUploaderTest, UploadsTreeIntoFreshContainer) {
  TreeUploader up(*pipeline);
  auto report = up.uploadDirectory(root, "repo");

  EXPECT_TRUE(report.ok());
  EXPECT_EQ(report.total, 5u);
  EXPECT_EQ(report.succeeded, 5u);
  EXPECT_TRUE(store.hasContainer("repo"));
  EXPECT_EQ(store.object("repo", "batch1/item_000/contents"), "doc.pdf\n");
  // The document exceeds the threshold and goes through a manifest.
  EXPECT_FALSE(store.manifest("repo", "batch1/item_000/doc.pdf").empty());
  EXPECT_TRUE(store.hasContainer("repo_segments"));
  EXPECT_TRUE(sessions->list().empty());
  EXPECT_FALSE(store.has("repo", "batch1/item_000/scratch.txt"));

  auto j = to_json(report);
  EXPECT_EQ(j["results"].size(), 5u);
  EXPECT_EQ(j["container"], "repo");
}

TEST_F(TreeUploaderTest, AuthFailureAbortsRemainingFiles) {
  store.addContainer("repo");
  store.failNext("put", TransportStatus::AuthFailed, 1, 401);
  TreeUploader up(*pipeline);
  auto report = up.uploadDirectory(root, "repo");

  EXPECT_TRUE(report.aborted);
  EXPECT_FALSE(report.ok());
  EXPECT_EQ(report.results.size(), 1u);
  EXPECT_EQ(report.succeeded, 0u);
}

TEST_F(TreeUploaderTest, CancellationStopsBeforeFirstFile) {
  CancellationToken cancel;
  cancel.cancel();
  TreeUploader up(*pipeline);
  auto report = up.uploadDirectory(root, "repo", cancel);
  EXPECT_TRUE(report.aborted);
  EXPECT_TRUE(report.results.empty());
  EXPECT_EQ(store.putCalls.load(), 0);
}

TEST_F(TreeUploaderTest, ContainerAuthFailureThrows) {
  store.failNext("head", TransportStatus::AuthFailed, 1, 403);
  TreeUploader up(*pipeline);
  EXPECT_THROW(up.uploadDirectory(root, "repo"), FatalTransportError);
}
