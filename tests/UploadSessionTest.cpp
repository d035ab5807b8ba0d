#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "core/upload/UploadSession.hpp"

using namespace safs;

static UploadSession session(uint64_t total, uint64_t chunk) {
  UploadSession s;
  s.id = "s1";
  s.container = "archive";
  s.segmentContainer = "archive_segments";
  s.objectKey = "batch/big.bin";
  s.totalBytes = total;
  s.chunkSize = chunk;
  return s;
}

TEST(UploadSessionTest, TenMegabytesInFourMegabyteChunks) {
  const uint64_t MB = 1024 * 1024;
  auto s = session(10 * MB, 4 * MB);
  ASSERT_EQ(s.segmentCount(), 3u);
  EXPECT_EQ(s.expectedSize(0), 4 * MB);
  EXPECT_EQ(s.expectedSize(1), 4 * MB);
  EXPECT_EQ(s.expectedSize(2), 2 * MB);
  EXPECT_EQ(s.expectedSize(3), 0u);
}

TEST(UploadSessionTest, ExactMultipleHasNoShortTail) {
  auto s = session(12, 4);
  EXPECT_EQ(s.segmentCount(), 3u);
  EXPECT_EQ(s.expectedSize(2), 4u);
}

TEST(UploadSessionTest, HighestContiguousTracksGaps) {
  auto s = session(50, 10);
  EXPECT_EQ(s.highestContiguous(), -1);
  s.committed[1] = {10, "b"};
  s.committed[3] = {10, "d"};
  EXPECT_EQ(s.highestContiguous(), -1);
  s.committed[0] = {10, "a"};
  EXPECT_EQ(s.highestContiguous(), 1);
  EXPECT_EQ(s.missing(), (std::vector<uint64_t>{2, 4}));
  EXPECT_FALSE(s.allCommitted());
  EXPECT_EQ(s.committedBytes(), 30u);
}

TEST(UploadSessionTest, SegmentKeysArePaddedAndParseBack) {
  auto s = session(50, 10);
  EXPECT_EQ(s.segmentKey(7), "batch/big.bin/segment-00000007");
  EXPECT_EQ(parse_segment_key(s.objectKey, s.segmentKey(7)), std::optional<uint64_t>(7));
  EXPECT_FALSE(parse_segment_key(s.objectKey, "batch/big.bin/segment-7").has_value());
  EXPECT_FALSE(parse_segment_key(s.objectKey, "batch/other/segment-00000001").has_value());
  EXPECT_FALSE(parse_segment_key(s.objectKey, "batch/big.bin/segment-0000000x").has_value());
}

TEST(UploadSessionTest, ManifestListsSegmentsInIndexOrder) {
  auto s = session(25, 10);
  s.committed[2] = {5, "c"};
  s.committed[0] = {10, "a"};
  s.committed[1] = {10, "b"};
  auto j = nlohmann::json::parse(build_slo_manifest(s));
  ASSERT_EQ(j.size(), 3u);
  EXPECT_EQ(j[0]["path"], "/archive_segments/batch/big.bin/segment-00000000");
  EXPECT_EQ(j[0]["etag"], "a");
  EXPECT_EQ(j[2]["size_bytes"], 5);
}

TEST(UploadSessionTest, StateNamesRoundTrip) {
  for (auto st : {SessionState::Open, SessionState::Committed, SessionState::Abandoned}) {
    EXPECT_EQ(session_state_from_string(to_string(st)), std::optional<SessionState>(st));
  }
  EXPECT_FALSE(session_state_from_string("bogus").has_value());
}
