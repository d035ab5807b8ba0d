#include "ValidationReport.hpp"

#include <algorithm>
#include <tuple>

#include "core/metadata/CsvReader.hpp"

namespace safs {

const char* to_string(IssueKind k) {
  switch (k) {
    case IssueKind::MissingFile:       return "missing_file";
    case IssueKind::OrphanFile:        return "orphan_file";
    case IssueKind::MalformedRow:      return "malformed_row";
    case IssueKind::DuplicateFilename: return "duplicate_filename";
  }
  return "unknown";
}

bool GatePolicy::blocks(IssueKind k) const {
  switch (k) {
    case IssueKind::MissingFile:       return true;
    case IssueKind::MalformedRow:      return true;
    case IssueKind::OrphanFile:        return orphansBlock;
    case IssueKind::DuplicateFilename: return duplicatesBlock;
  }
  return true;
}

ValidationIssue ValidationIssue::missingFile(size_t row, const std::filesystem::path& expected) {
  ValidationIssue i;
  i.kind = IssueKind::MissingFile;
  i.row = row;
  i.filename = expected.filename().string();
  i.path = expected;
  return i;
}

ValidationIssue ValidationIssue::orphanFile(const std::filesystem::path& path) {
  ValidationIssue i;
  i.kind = IssueKind::OrphanFile;
  i.filename = path.filename().string();
  i.path = path;
  return i;
}

ValidationIssue ValidationIssue::malformedRow(std::optional<size_t> row, std::string reason) {
  ValidationIssue i;
  i.kind = IssueKind::MalformedRow;
  i.row = row;
  i.reason = std::move(reason);
  return i;
}

ValidationIssue ValidationIssue::duplicateFilename(std::string filename, std::vector<size_t> rows) {
  ValidationIssue i;
  i.kind = IssueKind::DuplicateFilename;
  i.filename = std::move(filename);
  i.rows = std::move(rows);
  return i;
}

std::string ValidationIssue::message() const {
  switch (kind) {
    case IssueKind::MissingFile:
      return "row " + std::to_string(row.value_or(0)) + ": \"" + filename + "\" not found in directory";
    case IssueKind::OrphanFile:
      return "document exists but is not listed in any metadata file: \"" + filename + "\"";
    case IssueKind::MalformedRow:
      return (row ? "row " + std::to_string(*row) + ": " : std::string("header: ")) + reason;
    case IssueKind::DuplicateFilename: {
      std::string rs;
      for (auto r : rows) rs += (rs.empty() ? "" : ", ") + std::to_string(r);
      return "\"" + filename + "\" is referenced by rows " + rs;
    }
  }
  return reason;
}

bool operator==(const ValidationIssue& a, const ValidationIssue& b) {
  return a.kind == b.kind && a.filename == b.filename && a.row == b.row && a.rows == b.rows &&
         a.path == b.path && a.sourceFile == b.sourceFile && a.line == b.line &&
         a.reason == b.reason && a.blocking == b.blocking;
}

bool issue_less(const ValidationIssue& a, const ValidationIssue& b) {
  const size_t ra = a.row ? *a.row : (a.rows.empty() ? 0 : a.rows.front());
  const size_t rb = b.row ? *b.row : (b.rows.empty() ? 0 : b.rows.front());
  return std::make_tuple(a.filename, static_cast<int>(a.kind), ra, a.sourceFile.string(), a.reason) <
         std::make_tuple(b.filename, static_cast<int>(b.kind), rb, b.sourceFile.string(), b.reason);
}

size_t ValidationReport::count(IssueKind k) const {
  return static_cast<size_t>(std::count_if(issues.begin(), issues.end(),
                                           [k](const ValidationIssue& i) { return i.kind == k; }));
}

size_t ValidationReport::blockingCount() const {
  return static_cast<size_t>(std::count_if(issues.begin(), issues.end(),
                                           [](const ValidationIssue& i) { return i.blocking; }));
}

nlohmann::json to_json(const ValidationIssue& i) {
  nlohmann::json j = {
    {"kind", to_string(i.kind)},
    {"filename", i.filename},
    {"blocking", i.blocking},
    {"message", i.message()}
  };
  if (i.row) j["row"] = *i.row;
  if (!i.rows.empty()) j["rows"] = i.rows;
  if (!i.path.empty()) j["path"] = i.path.string();
  if (!i.sourceFile.empty()) j["source_file"] = i.sourceFile.string();
  if (i.line) j["line"] = i.line;
  if (!i.reason.empty()) j["reason"] = i.reason;
  return j;
}

nlohmann::json to_json(const ValidationReport& r) {
  nlohmann::json files = nlohmann::json::array();
  for (const auto& f : r.metadataFiles) files.push_back(f.string());
  nlohmann::json issues = nlohmann::json::array();
  for (const auto& i : r.issues) issues.push_back(to_json(i));
  return {
    {"directory", r.directory.string()},
    {"metadata_files", files},
    {"rows_total", r.rowsTotal},
    {"valid_rows", r.validRows},
    {"documents", r.documentCount},
    {"passes_gate", r.passesGate()},
    {"counts", {
      {"missing_file", r.count(IssueKind::MissingFile)},
      {"orphan_file", r.count(IssueKind::OrphanFile)},
      {"malformed_row", r.count(IssueKind::MalformedRow)},
      {"duplicate_filename", r.count(IssueKind::DuplicateFilename)}
    }},
    {"issues", issues}
  };
}

void write_issues_csv(const ValidationReport& r, std::ostream& out) {
  out << "kind,row,filename,path,reason\n";
  for (const auto& i : r.issues) {
    std::string row;
    if (i.row) row = std::to_string(*i.row);
    for (auto x : i.rows) row += (row.empty() ? "" : ";") + std::to_string(x);
    out << to_string(i.kind) << ','
        << row << ','
        << csv_escape(i.filename) << ','
        << csv_escape(i.path.string()) << ','
        << csv_escape(i.kind == IssueKind::MalformedRow ? i.reason : i.message()) << '\n';
  }
}

} // namespace safs
