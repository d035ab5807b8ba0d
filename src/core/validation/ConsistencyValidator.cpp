#include "ConsistencyValidator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <set>
#include <system_error>

#include "core/errors/Errors.hpp"
#include "core/scan/DirectoryScanner.hpp"

namespace safs {

namespace fs = std::filesystem;

ConsistencyValidator::ConsistencyValidator(ValidationOptions opts, SchemaTable schema)
  : opts_(std::move(opts)), schema_(std::move(schema)) {}

ValidationReport ConsistencyValidator::validate(const fs::path& directory) const {
  return run(directory).report;
}

ValidationResult ConsistencyValidator::run(const fs::path& directory) const {
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    throw FilesystemError("not a readable directory: " + directory.string() +
                          (ec ? " (" + ec.message() + ")" : ""));
  }

  std::vector<fs::path> metadataFiles;
  std::vector<fs::path> documents;
  try {
    metadataFiles = list_files(directory, opts_.metadataExtensions);
    documents = list_files(directory, opts_.documentExtensions);
  } catch (const fs::filesystem_error& e) {
    throw FilesystemError(std::string("cannot list ") + directory.string() + ": " + e.what());
  }

  ValidationResult result;
  ValidationReport& report = result.report;
  report.directory = directory;
  report.metadataFiles = metadataFiles;
  report.documentCount = documents.size();

  std::set<std::string> present;
  for (const auto& d : documents) present.insert(d.filename().string());

  // filename -> contributing row indices, in row order
  std::map<std::string, std::vector<size_t>> referenced;
  std::vector<const MetadataRow*> matchable;

  size_t rowBase = 0;
  for (const auto& file : metadataFiles) {
    MetadataSheet sheet = load_metadata(file, schema_, rowBase);
    rowBase += sheet.rowCount;
    report.rowsTotal += sheet.rowCount;

    for (const auto& p : sheet.problems) {
      auto issue = ValidationIssue::malformedRow(p.rowIndex, p.reason);
      issue.filename = p.filename;
      issue.sourceFile = file;
      issue.line = p.line;
      report.issues.push_back(std::move(issue));
    }
    result.sheets.push_back({std::move(sheet.columns), std::move(sheet.rows)});
  }

  for (const auto& sheet : result.sheets) {
    for (const auto& row : sheet.rows) {
      referenced[row.filename()].push_back(row.rowIndex);
      if (present.count(row.filename()) == 0) {
        auto issue = ValidationIssue::missingFile(row.rowIndex, directory / row.filename());
        issue.filename = row.filename();
        issue.sourceFile = row.sourceFile;
        issue.line = row.line;
        report.issues.push_back(std::move(issue));
      }
    }
  }

  size_t valid = 0;
  for (const auto& kv : referenced) {
    if (kv.second.size() > 1) {
      report.issues.push_back(ValidationIssue::duplicateFilename(kv.first, kv.second));
    } else if (present.count(kv.first)) {
      ++valid;
    }
  }
  report.validRows = valid;

  for (const auto& d : documents) {
    if (referenced.count(d.filename().string()) == 0) {
      report.issues.push_back(ValidationIssue::orphanFile(d));
    }
  }

  for (auto& i : report.issues) i.blocking = opts_.gate.blocks(i.kind);
  std::stable_sort(report.issues.begin(), report.issues.end(), issue_less);

  spdlog::info("validate {}: {} rows, {} valid, {} documents, {} issues ({} blocking)",
               directory.string(), report.rowsTotal, report.validRows, report.documentCount,
               report.issues.size(), report.blockingCount());
  return result;
}

} // namespace safs
