#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace safs {

// Declaration order is the tie-break order when issues share a filename.
enum class IssueKind { MissingFile, OrphanFile, MalformedRow, DuplicateFilename };

const char* to_string(IssueKind k);

// Which issue kinds stop package assembly. MissingFile and MalformedRow
// always block.
struct GatePolicy {
  bool orphansBlock = false;
  bool duplicatesBlock = true;

  bool blocks(IssueKind k) const;
};

struct ValidationIssue {
  IssueKind kind = IssueKind::MalformedRow;
  std::string filename;                 // referenced or found name; may be empty for MalformedRow
  std::optional<size_t> row;            // MissingFile, MalformedRow
  std::vector<size_t> rows;             // DuplicateFilename
  std::filesystem::path path;           // expected (MissingFile) or found (OrphanFile) path
  std::filesystem::path sourceFile;     // metadata file the row came from
  size_t line = 0;
  std::string reason;
  bool blocking = false;

  static ValidationIssue missingFile(size_t row, const std::filesystem::path& expected);
  static ValidationIssue orphanFile(const std::filesystem::path& path);
  static ValidationIssue malformedRow(std::optional<size_t> row, std::string reason);
  static ValidationIssue duplicateFilename(std::string filename, std::vector<size_t> rows);

  std::string message() const;
};

bool operator==(const ValidationIssue& a, const ValidationIssue& b);
bool issue_less(const ValidationIssue& a, const ValidationIssue& b);

struct ValidationReport {
  std::filesystem::path directory;
  std::vector<std::filesystem::path> metadataFiles;
  size_t rowsTotal = 0;
  size_t validRows = 0;
  size_t documentCount = 0;
  std::vector<ValidationIssue> issues;

  size_t count(IssueKind k) const;
  size_t blockingCount() const;
  bool passesGate() const { return blockingCount() == 0; }
};

nlohmann::json to_json(const ValidationIssue& i);
nlohmann::json to_json(const ValidationReport& r);

// kind,row,filename,path,reason
void write_issues_csv(const ValidationReport& r, std::ostream& out);

} // namespace safs
