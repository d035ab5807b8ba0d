#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace safs {

enum class SessionState { Open, Committed, Abandoned };

const char* to_string(SessionState s);
std::optional<SessionState> session_state_from_string(const std::string& s);

struct SegmentRecord {
  uint64_t    size = 0;
  std::string etag;   // hex MD5 as reported by the store
};

// One logical segmented transfer. Segment i covers bytes
// [i * chunkSize, min(totalBytes, (i + 1) * chunkSize)).
struct UploadSession {
  std::string id;
  std::string container;
  std::string segmentContainer;
  std::string objectKey;
  std::optional<std::string> sourcePath;
  uint64_t    totalBytes = 0;
  uint64_t    chunkSize = 0;
  std::map<uint64_t, SegmentRecord> committed;
  bool        manifestCommitted = false;
  SessionState state = SessionState::Open;
  int64_t     createdAt = 0;
  int64_t     updatedAt = 0;

  uint64_t segmentCount() const;
  uint64_t expectedSize(uint64_t index) const;
  std::string segmentKey(uint64_t index) const;
  std::string segmentPrefix() const { return objectKey + "/"; }

  // Highest index h such that [0, h] are all committed; -1 when segment 0 is not.
  int64_t highestContiguous() const;
  bool allCommitted() const { return committed.size() == segmentCount(); }
  std::vector<uint64_t> missing() const;
  uint64_t committedBytes() const;
};

// "segment-00000042"
std::string segment_name(uint64_t index);

// Parses the index out of "<objectKey>/segment-NNNNNNNN"; nullopt for anything else.
std::optional<uint64_t> parse_segment_key(const std::string& objectKey, const std::string& key);

// Static large object manifest: [{path, etag, size_bytes}, ...] in index order.
std::string build_slo_manifest(const UploadSession& s);

nlohmann::json to_json(const UploadSession& s);

} // namespace safs
