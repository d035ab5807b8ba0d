#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace safs {

enum class FieldKind { Filename, Metadata, Extension };

// Parsed column header, e.g. "dc.subject.lcsh[en]" ->
// schema=dc element=subject qualifier=lcsh language=en.
struct FieldDescriptor {
  std::string column;
  FieldKind kind = FieldKind::Extension;
  std::string schema;
  std::string element;
  std::optional<std::string> qualifier;
  std::optional<std::string> language;
};

struct MappedField {
  FieldDescriptor descriptor;
  std::string value;
};

// Recognized metadata schemas and the descriptor file each one is written to.
// Namespaced columns whose schema is not listed become extension fields.
class SchemaTable {
public:
  SchemaTable();
  explicit SchemaTable(std::vector<std::string> schemas);

  bool recognizes(const std::string& schema) const;
  const std::vector<std::string>& schemas() const { return schemas_; }

  FieldDescriptor describe(const std::string& column) const;

  // "dublin_core.xml" for dc, "metadata_<schema>.xml" otherwise.
  static std::string descriptorFile(const std::string& schema);

private:
  std::vector<std::string> schemas_;
};

struct MetadataRow {
  std::filesystem::path sourceFile;
  size_t rowIndex = 0;   // 0-based across the directory's row set
  size_t line = 0;       // physical line in sourceFile
  std::vector<std::pair<std::string, std::string>> values; // column order

  const std::string& filename() const;
  const std::string* get(const std::string& column) const;
};

struct RowProblem {
  std::optional<size_t> rowIndex;  // none for header-level problems
  size_t line = 0;
  std::string filename;            // best effort, may be empty
  std::string reason;
};

// One metadata file mapped through a SchemaTable.
struct MetadataSheet {
  std::filesystem::path file;
  std::vector<FieldDescriptor> columns;
  std::vector<MetadataRow> rows;       // well-formed rows
  std::vector<RowProblem> problems;    // malformed rows and header problems
  size_t rowCount = 0;                 // well-formed + malformed data rows
};

// Reads and maps one CSV file. Row indices start at rowBase. Never throws on
// content problems; an unreadable file becomes a single header-level problem.
MetadataSheet load_metadata(const std::filesystem::path& file,
                            const SchemaTable& schema,
                            size_t rowBase = 0);

// The metadata entries of a row in column order, skipping empty values and
// the filename column.
std::vector<MappedField> map_row(const MetadataRow& row, const std::vector<FieldDescriptor>& columns);

} // namespace safs
