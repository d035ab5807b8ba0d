#include <gtest/gtest.h>

#include "core/errors/Errors.hpp"
#include "core/session/InitDb.hpp"
#include "core/session/SessionStore.hpp"
#include "TestSupport.hpp"

using namespace safs;

class SessionStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    dbPath = (dir / "db" / "sessions.db").string();
    initDatabase(dbPath, SAFS_SCHEMA_FILE);
  }

  static UploadSession sample(const std::string& id) {
    UploadSession s;
    s.id = id;
    s.container = "archive";
    s.segmentContainer = "archive_segments";
    s.objectKey = "batch/" + id;
    s.sourcePath = "/data/" + id;
    s.totalBytes = 25;
    s.chunkSize = 10;
    s.createdAt = s.updatedAt = 1700000000;
    return s;
  }

  test::TempDir dir;
  std::string dbPath;
};

TEST_F(SessionStoreTest, InitIsIdempotent) {
  EXPECT_TRUE(initDatabase(dbPath, SAFS_SCHEMA_FILE));
}

TEST_F(SessionStoreTest, MissingSchemaFileThrows) {
  EXPECT_THROW(initDatabase((dir / "other.db").string(), (dir / "none.sql").string()), StorageError);
}

TEST_F(SessionStoreTest, SegmentsSurviveReopen) {
  {
    SessionStore store(dbPath);
    store.insertSession(sample("s1"));
    store.commitSegment("s1", 0, {10, "aa"}, 1700000001);
    store.commitSegment("s1", 2, {5, "cc"}, 1700000002);
  }
  SessionStore reopened(dbPath);
  auto s = reopened.load("s1");
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->objectKey, "batch/s1");
  ASSERT_TRUE(s->sourcePath.has_value());
  EXPECT_EQ(*s->sourcePath, "/data/s1");
  ASSERT_EQ(s->committed.size(), 2u);
  EXPECT_EQ(s->committed.at(2).etag, "cc");
  EXPECT_EQ(s->committed.at(2).size, 5u);
  EXPECT_EQ(s->updatedAt, 1700000002);
  EXPECT_EQ(s->state, SessionState::Open);
}

TEST_F(SessionStoreTest, SaveReplacesSegmentSet) {
  SessionStore store(dbPath);
  auto s = sample("s1");
  store.insertSession(s);
  store.commitSegment("s1", 1, {10, "old"}, 1);

  s.committed[0] = {10, "a"};
  s.manifestCommitted = true;
  s.state = SessionState::Committed;
  store.saveSession(s);

  auto back = store.load("s1");
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(back->committed.size(), 1u);
  EXPECT_TRUE(back->committed.count(0));
  EXPECT_TRUE(back->manifestCommitted);
  EXPECT_EQ(back->state, SessionState::Committed);
}

TEST_F(SessionStoreTest, SaveUnknownSessionThrows) {
  SessionStore store(dbPath);
  EXPECT_THROW(store.saveSession(sample("ghost")), StorageError);
}

TEST_F(SessionStoreTest, RemoveKeepsHistory) {
  SessionStore store(dbPath);
  store.insertSession(sample("s1"));
  store.insertSession(sample("s2"));
  store.appendHistory("s1", "BEGIN", "{}", 1, "test");
  store.commitSegment("s1", 0, {10, "a"}, 2);
  store.removeSession("s1");

  EXPECT_FALSE(store.load("s1").has_value());
  ASSERT_EQ(store.list().size(), 1u);
  EXPECT_EQ(store.list()[0].id, "s2");
  auto h = store.history("s1");
  ASSERT_EQ(h.size(), 1u);
  EXPECT_EQ(h[0].event, "BEGIN");
  EXPECT_EQ(h[0].actor, "test");
}

TEST_F(SessionStoreTest, DuplicateInsertThrows) {
  SessionStore store(dbPath);
  store.insertSession(sample("s1"));
  EXPECT_THROW(store.insertSession(sample("s1")), StorageError);
}
