#include <gtest/gtest.h>

#include "core/upload/ObjectStore.hpp"
#include "core/upload/RetryPolicy.hpp"

using namespace safs;
using std::chrono::milliseconds;

TEST(RetryPolicyTest, DelayDoublesUpToCap) {
  RetryPolicy p;
  p.baseDelay = milliseconds(100);
  p.maxDelay = milliseconds(1000);
  p.jitter = 0.0;
  EXPECT_EQ(p.delayFor(1), milliseconds(100));
  EXPECT_EQ(p.delayFor(2), milliseconds(200));
  EXPECT_EQ(p.delayFor(4), milliseconds(800));
  EXPECT_EQ(p.delayFor(5), milliseconds(1000));
  EXPECT_EQ(p.delayFor(60), milliseconds(1000));
}

TEST(RetryPolicyTest, JitterStaysWithinBounds) {
  RetryPolicy p;
  p.baseDelay = milliseconds(1000);
  p.maxDelay = milliseconds(1000);
  p.jitter = 0.25;
  std::mt19937_64 rng(42);
  for (int i = 0; i < 200; ++i) {
    auto d = p.delayFor(3, &rng);
    EXPECT_GE(d.count(), 750);
    EXPECT_LE(d.count(), 1000);
  }
}

TEST(TransportResultTest, ClassifiesHttpStatus) {
  EXPECT_EQ(TransportResult::fromHttpStatus(201).status, TransportStatus::Ok);
  EXPECT_EQ(TransportResult::fromHttpStatus(401).status, TransportStatus::AuthFailed);
  EXPECT_EQ(TransportResult::fromHttpStatus(403).status, TransportStatus::AuthFailed);
  EXPECT_EQ(TransportResult::fromHttpStatus(404).status, TransportStatus::NotFound);
  EXPECT_EQ(TransportResult::fromHttpStatus(408).status, TransportStatus::Transient);
  EXPECT_EQ(TransportResult::fromHttpStatus(429).status, TransportStatus::Transient);
  EXPECT_EQ(TransportResult::fromHttpStatus(503).status, TransportStatus::Transient);
  EXPECT_EQ(TransportResult::fromHttpStatus(400).status, TransportStatus::Fatal);
  EXPECT_EQ(TransportResult::fromHttpStatus(409).status, TransportStatus::Fatal);
}
