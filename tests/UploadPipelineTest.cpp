#include <gtest/gtest.h>

#include <thread>

#include "core/errors/Errors.hpp"
#include "core/session/InitDb.hpp"
#include "core/session/SessionStore.hpp"
#include "core/upload/UploadPipeline.hpp"
#include "TestSupport.hpp"

using namespace safs;
using std::chrono::milliseconds;

namespace {

constexpr uint64_t MB = 1024 * 1024;

class UploadPipelineTest : public ::testing::Test {
protected:
  void SetUp() override {
    dbPath = (dir / "sessions.db").string();
    initDatabase(dbPath, SAFS_SCHEMA_FILE);
    sessions = std::make_unique<SessionStore>(dbPath);
    store.addContainer("archive");
    store.addContainer("archive_segments");

    retry.maxAttempts = 4;
    retry.baseDelay = milliseconds(100);
    retry.maxDelay = milliseconds(1000);
    retry.jitter = 0.0;

    opts.segmentThreshold = 16;
    opts.chunkSize = 4;
    opts.maxInFlight = 3;
  }

  UploadPipeline pipeline() { return UploadPipeline(store, *sessions, opts, retry, &sleeper); }

  std::string chunkOf(const std::string& data, const UploadSession& s, uint64_t i) {
    return data.substr(static_cast<size_t>(i * s.chunkSize), static_cast<size_t>(s.expectedSize(i)));
  }

  test::TempDir dir;
  std::string dbPath;
  std::unique_ptr<SessionStore> sessions;
  test::FakeObjectStore store;
  test::FakeSleeper sleeper;
  RetryPolicy retry;
  UploadOptions opts;
};

} // namespace

TEST_F(UploadPipelineTest, FinalizeWaitsForAllSegmentsAndWritesManifestOnce) {
  auto p = pipeline();
  const std::string data = test::payload(10 * MB);
  auto s = p.beginSession("archive", "big.bin", data.size(), 4 * MB);
  ASSERT_EQ(s.segmentCount(), 3u);
  EXPECT_EQ(s.segmentContainer, "archive_segments");

  ASSERT_EQ(p.uploadChunk(s, 0, chunkOf(data, s, 0)).status, ChunkStatus::Committed);
  ASSERT_EQ(p.uploadChunk(s, 1, chunkOf(data, s, 1)).status, ChunkStatus::Committed);

  auto early = p.finalize(s);
  EXPECT_EQ(early.status, FinalizeStatus::Incomplete);
  EXPECT_EQ(early.missing, (std::vector<uint64_t>{2}));
  EXPECT_EQ(store.manifestPuts.load(), 0);

  ASSERT_EQ(p.uploadChunk(s, 2, chunkOf(data, s, 2)).status, ChunkStatus::Committed);
  EXPECT_EQ(s.committed.at(2).size, 2 * MB);

  store.setManifestDelay(milliseconds(50));
  FinalizeResult r1, r2;
  std::thread t1([&] { r1 = p.finalize(s); });
  std::thread t2([&] { r2 = p.finalize(s); });
  t1.join();
  t2.join();

  EXPECT_EQ(r1.status, FinalizeStatus::ManifestCommitted);
  EXPECT_EQ(r2.status, FinalizeStatus::ManifestCommitted);
  EXPECT_NE(r1.wroteManifest, r2.wroteManifest);
  EXPECT_EQ(store.manifestPuts.load(), 1);
  EXPECT_TRUE(s.manifestCommitted);

  auto manifest = nlohmann::json::parse(store.manifest("archive", "big.bin"));
  ASSERT_EQ(manifest.size(), 3u);
  EXPECT_EQ(manifest[2]["size_bytes"], 2 * MB);

  EXPECT_FALSE(sessions->load(s.id).has_value());
  auto history = sessions->history(s.id);
  ASSERT_FALSE(history.empty());
  EXPECT_EQ(history.back().event, "COMMITTED");
}

TEST_F(UploadPipelineTest, ReuploadingSameContentIsNoOpAndDifferentContentIsFatal) {
  auto p = pipeline();
  auto s = p.beginSession("archive", "obj", 10, 4);
  ASSERT_EQ(p.uploadChunk(s, 0, "AAAA").status, ChunkStatus::Committed);

  auto again = p.uploadChunk(s, 0, "AAAA");
  EXPECT_EQ(again.status, ChunkStatus::Committed);
  EXPECT_TRUE(again.alreadyCommitted);
  EXPECT_EQ(store.putCalls.load(), 1);

  EXPECT_EQ(p.uploadChunk(s, 0, "BBBB").status, ChunkStatus::FatalError);
  EXPECT_EQ(s.committed.at(0).etag, md5_hex("AAAA"));
}

TEST_F(UploadPipelineTest, RejectsOutOfRangeIndexAndWrongSize) {
  auto p = pipeline();
  auto s = p.beginSession("archive", "obj", 10, 4);
  EXPECT_EQ(p.uploadChunk(s, 3, "xx").status, ChunkStatus::FatalError);
  EXPECT_EQ(p.uploadChunk(s, 2, "xxx").status, ChunkStatus::FatalError);
  EXPECT_EQ(p.uploadChunk(s, 2, "xx").status, ChunkStatus::Committed);
  EXPECT_EQ(store.putCalls.load(), 1);
}

TEST_F(UploadPipelineTest, BeginSessionValidatesArguments) {
  auto p = pipeline();
  EXPECT_THROW(p.beginSession("archive", "obj", 10, 0), Error);
  EXPECT_THROW(p.beginSession("archive", "", 10, 4), Error);
  EXPECT_THROW(p.beginSession("archive", "obj", 0, 4), Error);
}

TEST_F(UploadPipelineTest, TransientFailuresBackOffExponentially) {
  auto p = pipeline();
  auto s = p.beginSession("archive", "obj", 8, 4);
  store.failNext("put", TransportStatus::Transient, 2, 503);

  auto r = p.uploadChunk(s, 0, "AAAA");
  EXPECT_EQ(r.status, ChunkStatus::Committed);
  EXPECT_EQ(r.attempts, 3);
  EXPECT_EQ(sleeper.delays(), (std::vector<milliseconds>{milliseconds(100), milliseconds(200)}));
}

TEST_F(UploadPipelineTest, ExhaustedRetriesAreRetryable) {
  auto p = pipeline();
  auto s = p.beginSession("archive", "obj", 8, 4);
  store.failNext("put", TransportStatus::Transient, 10, 500);

  auto r = p.uploadChunk(s, 0, "AAAA");
  EXPECT_EQ(r.status, ChunkStatus::RetryableError);
  EXPECT_EQ(r.attempts, 4);
  EXPECT_EQ(sleeper.delays().size(), 3u);
  EXPECT_TRUE(s.committed.empty());
}

TEST_F(UploadPipelineTest, AuthFailureIsFatalWithoutRetry) {
  auto p = pipeline();
  auto s = p.beginSession("archive", "obj", 8, 4);
  store.failNext("put", TransportStatus::AuthFailed, 1, 401);

  auto r = p.uploadChunk(s, 0, "AAAA");
  EXPECT_EQ(r.status, ChunkStatus::FatalError);
  EXPECT_EQ(r.transport, TransportStatus::AuthFailed);
  EXPECT_EQ(r.attempts, 1);
  EXPECT_TRUE(sleeper.delays().empty());
}

TEST_F(UploadPipelineTest, MissingSegmentContainerIsCreatedOnce) {
  test::FakeObjectStore bare;
  bare.addContainer("archive");
  UploadPipeline p(bare, *sessions, opts, retry, &sleeper);
  auto s = p.beginSession("archive", "obj", 8, 4);

  EXPECT_EQ(p.uploadChunk(s, 0, "AAAA").status, ChunkStatus::Committed);
  EXPECT_TRUE(bare.hasContainer("archive_segments"));
  EXPECT_EQ(bare.createCalls.load(), 1);
  EXPECT_EQ(p.uploadChunk(s, 1, "BBBB").status, ChunkStatus::Committed);
  EXPECT_EQ(bare.createCalls.load(), 1);
}

TEST_F(UploadPipelineTest, ContainerCreationRetriesOriginalOperationOnlyOnce) {
  auto p = pipeline();
  auto s = p.beginSession("archive", "obj", 8, 4);
  store.failNext("put", TransportStatus::NotFound, 2, 404);

  auto r = p.uploadChunk(s, 0, "AAAA");
  EXPECT_EQ(r.status, ChunkStatus::FatalError);
  EXPECT_EQ(r.attempts, 2);
  EXPECT_EQ(store.createCalls.load(), 1);
}

TEST_F(UploadPipelineTest, FinalizeSurfacesFatalManifestFailure) {
  auto p = pipeline();
  auto s = p.beginSession("archive", "obj", 4, 4);
  ASSERT_EQ(p.uploadChunk(s, 0, "AAAA").status, ChunkStatus::Committed);
  store.failNext("manifest", TransportStatus::Fatal, 1, 400);
  EXPECT_THROW(p.finalize(s), FatalTransportError);
  EXPECT_FALSE(s.manifestCommitted);
  EXPECT_TRUE(sessions->load(s.id).has_value());
}

TEST_F(UploadPipelineTest, ResumedUploadProducesSameManifestAsUninterruptedRun) {
  const std::string data = test::payload(18);  // 5 segments of 4,4,4,4,2

  test::FakeObjectStore straight;
  straight.addContainer("archive");
  {
    UploadPipeline p(straight, *sessions, opts, retry, &sleeper);
    auto s = p.beginSession("archive", "obj", data.size(), 4);
    for (uint64_t i = 0; i < s.segmentCount(); ++i) ASSERT_EQ(p.uploadChunk(s, i, chunkOf(data, s, i)).status, ChunkStatus::Committed);
    ASSERT_EQ(p.finalize(s).status, FinalizeStatus::ManifestCommitted);
  }

  std::string id;
  {
    UploadPipeline first(store, *sessions, opts, retry, &sleeper);
    auto s = first.beginSession("archive", "obj", data.size(), 4);
    id = s.id;
    for (uint64_t i : {2, 0, 1}) ASSERT_EQ(first.uploadChunk(s, i, chunkOf(data, s, i)).status, ChunkStatus::Committed);
  }

  // Fresh store handle and pipeline, as after a restart.
  SessionStore reopened(dbPath);
  UploadPipeline second(store, reopened, opts, retry, &sleeper);
  auto s = second.resume(id);
  EXPECT_EQ(s.committed.size(), 3u);
  EXPECT_EQ(s.highestContiguous(), 2);
  for (uint64_t i : s.missing()) ASSERT_EQ(second.uploadChunk(s, i, chunkOf(data, s, i)).status, ChunkStatus::Committed);
  ASSERT_EQ(second.finalize(s).status, FinalizeStatus::ManifestCommitted);

  EXPECT_EQ(store.manifest("archive", "obj"), straight.manifest("archive", "obj"));
}

TEST_F(UploadPipelineTest, ResumeAdoptsRemoteSegmentsMissingLocally) {
  auto p = pipeline();
  auto s = p.beginSession("archive", "obj", 10, 4);
  ASSERT_EQ(p.uploadChunk(s, 0, "AAAA").status, ChunkStatus::Committed);
  // Segment 1 landed remotely but the process died before recording it.
  store.putRaw("archive_segments", s.segmentKey(1), "BBBB");
  // Wrong-sized leftovers are not adopted.
  store.putRaw("archive_segments", s.segmentKey(2), "CCCC");

  auto resumed = p.resume(s.id);
  EXPECT_EQ(resumed.committed.size(), 2u);
  EXPECT_EQ(resumed.committed.at(1).etag, md5_hex("BBBB"));
  EXPECT_EQ(resumed.missing(), (std::vector<uint64_t>{2}));
  EXPECT_EQ(sessions->load(s.id)->committed.size(), 2u);
}

TEST_F(UploadPipelineTest, ResumeRefusesWhenCommittedSegmentVanished) {
  auto p = pipeline();
  auto s = p.beginSession("archive", "obj", 10, 4);
  ASSERT_EQ(p.uploadChunk(s, 0, "AAAA").status, ChunkStatus::Committed);
  store.eraseRaw("archive_segments", s.segmentKey(0));
  EXPECT_THROW(p.resume(s.id), StateInconsistencyError);
}

TEST_F(UploadPipelineTest, ResumeRefusesWhenRemoteSegmentDiffers) {
  auto p = pipeline();
  auto s = p.beginSession("archive", "obj", 10, 4);
  ASSERT_EQ(p.uploadChunk(s, 0, "AAAA").status, ChunkStatus::Committed);
  store.putRaw("archive_segments", s.segmentKey(0), "ZZZZ");
  EXPECT_THROW(p.resume(s.id), StateInconsistencyError);
}

TEST_F(UploadPipelineTest, ResumeRefusesSegmentsBeyondSessionRange) {
  auto p = pipeline();
  auto s = p.beginSession("archive", "obj", 10, 4);
  store.putRaw("archive_segments", s.segmentKey(9), "AAAA");
  EXPECT_THROW(p.resume(s.id), StateInconsistencyError);
}

TEST_F(UploadPipelineTest, ResumeUnknownSessionThrows) {
  auto p = pipeline();
  EXPECT_THROW(p.resume("no-such-session"), StorageError);
}

TEST_F(UploadPipelineTest, SmallFileIsSinglePut) {
  auto p = pipeline();
  auto file = test::write_file(dir / "small.txt", "hello");
  auto r = p.uploadFile("archive", "docs/small.txt", file);
  ASSERT_EQ(r.status, FileUploadStatus::Completed) << r.message;
  EXPECT_FALSE(r.sessionId.has_value());
  EXPECT_EQ(store.object("archive", "docs/small.txt"), "hello");
  EXPECT_TRUE(sessions->list().empty());
}

TEST_F(UploadPipelineTest, LargeFileIsSegmentedConcurrently) {
  auto p = pipeline();
  const std::string data = test::payload(37);
  auto file = test::write_file(dir / "large.bin", data);

  auto r = p.uploadFile("archive", "large.bin", file);
  ASSERT_EQ(r.status, FileUploadStatus::Completed) << r.message;
  ASSERT_TRUE(r.sessionId.has_value());
  EXPECT_EQ(r.segments, 10u);
  EXPECT_EQ(store.keys("archive_segments").size(), 10u);
  EXPECT_EQ(store.manifestPuts.load(), 1);
  EXPECT_TRUE(sessions->list().empty());

  std::string joined;
  for (const auto& k : store.keys("archive_segments")) joined += store.object("archive_segments", k);
  EXPECT_EQ(joined, data);
}

TEST_F(UploadPipelineTest, IncompleteUploadCanBeResumedFromDisk) {
  opts.maxInFlight = 1;
  auto p = pipeline();
  auto file = test::write_file(dir / "large.bin", test::payload(20));
  store.failNext("put", TransportStatus::Transient, retry.maxAttempts, 503);

  auto first = p.uploadFile("archive", "large.bin", file);
  ASSERT_EQ(first.status, FileUploadStatus::Incomplete);
  ASSERT_TRUE(first.sessionId.has_value());
  EXPECT_EQ(store.manifestPuts.load(), 0);

  auto second = p.resumeFile(*first.sessionId);
  EXPECT_EQ(second.status, FileUploadStatus::Completed) << second.message;
  EXPECT_EQ(store.manifestPuts.load(), 1);
  EXPECT_FALSE(sessions->load(*first.sessionId).has_value());
}

TEST_F(UploadPipelineTest, ResumeFileRejectsChangedSource) {
  opts.maxInFlight = 1;
  auto p = pipeline();
  auto file = test::write_file(dir / "large.bin", test::payload(20));
  store.failNext("put", TransportStatus::Transient, retry.maxAttempts, 503);
  auto first = p.uploadFile("archive", "large.bin", file);
  ASSERT_TRUE(first.sessionId.has_value());

  test::write_file(file, test::payload(21));
  EXPECT_THROW(p.resumeFile(*first.sessionId), StateInconsistencyError);
}

TEST_F(UploadPipelineTest, AuthFailureStopsSegmentedUpload) {
  opts.maxInFlight = 1;
  auto p = pipeline();
  auto file = test::write_file(dir / "large.bin", test::payload(40));
  store.failNext("put", TransportStatus::AuthFailed, 1, 403);

  auto r = p.uploadFile("archive", "large.bin", file);
  EXPECT_EQ(r.status, FileUploadStatus::Failed);
  EXPECT_EQ(r.transport, TransportStatus::AuthFailed);
  EXPECT_LT(store.putCalls.load(), 10);
  EXPECT_EQ(store.manifestPuts.load(), 0);
}

TEST_F(UploadPipelineTest, CancelledUploadSendsNothing) {
  auto p = pipeline();
  auto file = test::write_file(dir / "large.bin", test::payload(40));
  CancellationToken cancel;
  cancel.cancel();

  auto r = p.uploadFile("archive", "large.bin", file, cancel);
  EXPECT_EQ(r.status, FileUploadStatus::Cancelled);
  EXPECT_EQ(store.putCalls.load(), 0);
}

TEST_F(UploadPipelineTest, AbandonDeletesRemoteSegmentsAndLocalState) {
  auto p = pipeline();
  auto s = p.beginSession("archive", "obj", 10, 4);
  ASSERT_EQ(p.uploadChunk(s, 0, "AAAA").status, ChunkStatus::Committed);
  ASSERT_EQ(p.uploadChunk(s, 1, "BBBB").status, ChunkStatus::Committed);

  p.abandon(s.id, true);
  EXPECT_TRUE(store.keys("archive_segments").empty());
  EXPECT_FALSE(sessions->load(s.id).has_value());
  EXPECT_EQ(sessions->history(s.id).back().event, "ABANDONED");
}

TEST_F(UploadPipelineTest, VerifyAccessReportsAuthFailure) {
  auto p = pipeline();
  EXPECT_TRUE(p.verifyAccess().ok());
  store.failNext("access", TransportStatus::AuthFailed, 1, 401);
  EXPECT_EQ(p.verifyAccess().status, TransportStatus::AuthFailed);
}

TEST_F(UploadPipelineTest, EnsureContainerCreatesMissingContainer) {
  auto p = pipeline();
  p.ensureContainer("fresh");
  EXPECT_TRUE(store.hasContainer("fresh"));
  store.failNext("head", TransportStatus::AuthFailed, 1, 403);
  EXPECT_THROW(p.ensureContainer("other"), FatalTransportError);
}

TEST_F(UploadPipelineTest, CommittedSessionsReleaseTheirLocks) {
  auto p = pipeline();
  auto s = p.beginSession("archive", "obj", 8, 4);
  ASSERT_EQ(p.uploadChunk(s, 0, "AAAA").status, ChunkStatus::Committed);
  ASSERT_EQ(p.uploadChunk(s, 1, "BBBB").status, ChunkStatus::Committed);
  EXPECT_EQ(p.trackedSessions(), 1u);

  auto first = p.finalize(s);
  EXPECT_TRUE(first.wroteManifest);
  EXPECT_EQ(p.trackedSessions(), 0u);

  auto late = p.finalize(s);
  EXPECT_EQ(late.status, FinalizeStatus::ManifestCommitted);
  EXPECT_FALSE(late.wroteManifest);
  EXPECT_EQ(store.manifestPuts.load(), 1);
  EXPECT_EQ(p.trackedSessions(), 0u);

  auto file = test::write_file(dir / "large.bin", test::payload(37));
  ASSERT_EQ(p.uploadFile("archive", "large.bin", file).status, FileUploadStatus::Completed);
  EXPECT_EQ(p.trackedSessions(), 0u);
}

TEST_F(UploadPipelineTest, ResumeFileReuploadsAdoptedSegmentsThatDifferFromSource) {
  opts.maxInFlight = 1;
  auto p = pipeline();
  const std::string data = test::payload(20);
  auto file = test::write_file(dir / "large.bin", data);
  auto s = p.beginSession("archive", "large.bin", data.size(), 4, file.string());

  // Same size as the source range, different bytes.
  store.putRaw("archive_segments", s.segmentKey(1), "XXXX");
  store.putRaw("archive_segments", s.segmentKey(2), chunkOf(data, s, 2));

  auto r = p.resumeFile(s.id);
  ASSERT_EQ(r.status, FileUploadStatus::Completed) << r.message;
  EXPECT_EQ(store.object("archive_segments", s.segmentKey(1)), chunkOf(data, s, 1));
  EXPECT_EQ(store.putCalls.load(), 4);

  std::string joined;
  for (uint64_t i = 0; i < s.segmentCount(); ++i) joined += store.object("archive_segments", s.segmentKey(i));
  EXPECT_EQ(joined, data);

  bool rejected = false;
  for (const auto& h : sessions->history(s.id)) rejected = rejected || h.event == "ADOPTION_REJECTED";
  EXPECT_TRUE(rejected);
}
