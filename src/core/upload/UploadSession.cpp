#include "UploadSession.hpp"

#include <cstdio>

using nlohmann::json;

namespace safs {

const char* to_string(SessionState s) {
  switch (s) {
    case SessionState::Open:      return "open";
    case SessionState::Committed: return "committed";
    case SessionState::Abandoned: return "abandoned";
  }
  return "unknown";
}

std::optional<SessionState> session_state_from_string(const std::string& s) {
  if (s == "open") return SessionState::Open;
  if (s == "committed") return SessionState::Committed;
  if (s == "abandoned") return SessionState::Abandoned;
  return std::nullopt;
}

uint64_t UploadSession::segmentCount() const {
  if (chunkSize == 0) return 0;
  return (totalBytes + chunkSize - 1) / chunkSize;
}

uint64_t UploadSession::expectedSize(uint64_t index) const {
  const uint64_t n = segmentCount();
  if (index >= n) return 0;
  if (index + 1 < n) return chunkSize;
  return totalBytes - index * chunkSize;
}

std::string segment_name(uint64_t index) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "segment-%08llu", static_cast<unsigned long long>(index));
  return buf;
}

std::string UploadSession::segmentKey(uint64_t index) const {
  return segmentPrefix() + segment_name(index);
}

std::optional<uint64_t> parse_segment_key(const std::string& objectKey, const std::string& key) {
  const std::string prefix = objectKey + "/segment-";
  if (key.size() <= prefix.size() || key.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
  const std::string digits = key.substr(prefix.size());
  if (digits.size() < 8) return std::nullopt;
  uint64_t v = 0;
  for (char c : digits) {
    if (c < '0' || c > '9') return std::nullopt;
    v = v * 10 + static_cast<uint64_t>(c - '0');
  }
  return v;
}

int64_t UploadSession::highestContiguous() const {
  int64_t h = -1;
  for (const auto& [idx, _] : committed) {
    if (static_cast<int64_t>(idx) != h + 1) break;
    h = static_cast<int64_t>(idx);
  }
  return h;
}

std::vector<uint64_t> UploadSession::missing() const {
  std::vector<uint64_t> out;
  const uint64_t n = segmentCount();
  for (uint64_t i = 0; i < n; ++i)
    if (!committed.count(i)) out.push_back(i);
  return out;
}

uint64_t UploadSession::committedBytes() const {
  uint64_t total = 0;
  for (const auto& [_, seg] : committed) total += seg.size;
  return total;
}

std::string build_slo_manifest(const UploadSession& s) {
  json arr = json::array();
  for (const auto& [idx, seg] : s.committed) {
    arr.push_back({
      {"path", "/" + s.segmentContainer + "/" + s.segmentKey(idx)},
      {"etag", seg.etag},
      {"size_bytes", seg.size}
    });
  }
  return arr.dump();
}

json to_json(const UploadSession& s) {
  json committed = json::array();
  for (const auto& [idx, seg] : s.committed)
    committed.push_back({{"index", idx}, {"size", seg.size}, {"etag", seg.etag}});

  json j = {
    {"id", s.id},
    {"container", s.container},
    {"segment_container", s.segmentContainer},
    {"object_key", s.objectKey},
    {"total_bytes", s.totalBytes},
    {"chunk_size", s.chunkSize},
    {"segment_count", s.segmentCount()},
    {"highest_contiguous", s.highestContiguous()},
    {"committed", committed},
    {"manifest_committed", s.manifestCommitted},
    {"state", to_string(s.state)},
    {"created_at", s.createdAt},
    {"updated_at", s.updatedAt}
  };
  j["source_path"] = s.sourcePath ? json(*s.sourcePath) : json(nullptr);
  return j;
}

} // namespace safs
