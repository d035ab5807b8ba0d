#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "core/metadata/SchemaMapper.hpp"
#include "core/validation/ValidationReport.hpp"

namespace safs {

struct ValidationOptions {
  std::vector<std::string> metadataExtensions {".csv"};
  std::vector<std::string> documentExtensions {".pdf"};
  GatePolicy gate;
};

// Rows that survived parsing, plus the columns they were mapped with. Handed
// to the assembler so it never re-reads the metadata files.
struct ValidatedSheet {
  std::vector<FieldDescriptor> columns;
  std::vector<MetadataRow> rows;
};

struct ValidationResult {
  ValidationReport report;
  std::vector<ValidatedSheet> sheets;
};

// Read-only reconciliation of a directory's metadata rows against its
// documents. Anomalies become issues; only an unreadable directory throws.
class ConsistencyValidator {
public:
  explicit ConsistencyValidator(ValidationOptions opts = {}, SchemaTable schema = {});

  ValidationReport validate(const std::filesystem::path& directory) const;

  // Same as validate() but also returns the parsed rows.
  ValidationResult run(const std::filesystem::path& directory) const;

  const ValidationOptions& options() const { return opts_; }
  const SchemaTable& schema() const { return schema_; }

private:
  ValidationOptions opts_;
  SchemaTable schema_;
};

} // namespace safs
