#include "SchemaMapper.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

#include "CsvReader.hpp"
#include "core/errors/Errors.hpp"

namespace safs {

static const std::string kFilenameColumn = "filename";

static bool is_token(const std::string& s) {
  if (s.empty()) return false;
  return std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '-';
  });
}

static std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

SchemaTable::SchemaTable() : schemas_{"dc", "dcterms", "local"} {}

SchemaTable::SchemaTable(std::vector<std::string> schemas) : schemas_(std::move(schemas)) {}

bool SchemaTable::recognizes(const std::string& schema) const {
  return std::find(schemas_.begin(), schemas_.end(), schema) != schemas_.end();
}

std::string SchemaTable::descriptorFile(const std::string& schema) {
  if (schema == "dc") return "dublin_core.xml";
  return "metadata_" + schema + ".xml";
}

FieldDescriptor SchemaTable::describe(const std::string& column) const {
  FieldDescriptor d;
  d.column = column;
  if (column == kFilenameColumn) {
    d.kind = FieldKind::Filename;
    return d;
  }

  std::string base = column;
  if (!base.empty() && base.back() == ']') {
    const auto open = base.rfind('[');
    if (open != std::string::npos) {
      std::string lang = base.substr(open + 1, base.size() - open - 2);
      base = base.substr(0, open);
      if (!lang.empty()) d.language = lang;
    }
  }

  const auto dot1 = base.find('.');
  if (dot1 == std::string::npos) return d; // opaque extension
  d.schema = base.substr(0, dot1);
  const auto dot2 = base.find('.', dot1 + 1);
  if (dot2 == std::string::npos) {
    d.element = base.substr(dot1 + 1);
  } else {
    d.element = base.substr(dot1 + 1, dot2 - dot1 - 1);
    d.qualifier = base.substr(dot2 + 1);
  }

  const bool wellFormed = is_token(d.schema) && is_token(d.element) &&
                          (!d.qualifier || !d.qualifier->empty());
  if (wellFormed && recognizes(d.schema)) d.kind = FieldKind::Metadata;
  return d;
}

const std::string& MetadataRow::filename() const {
  static const std::string empty;
  const std::string* v = get(kFilenameColumn);
  return v ? *v : empty;
}

const std::string* MetadataRow::get(const std::string& column) const {
  for (const auto& kv : values) {
    if (kv.first == column) return &kv.second;
  }
  return nullptr;
}

MetadataSheet load_metadata(const std::filesystem::path& file, const SchemaTable& schema, size_t rowBase) {
  MetadataSheet sheet;
  sheet.file = file;

  CsvTable table;
  try {
    table = read_csv_file(file);
  } catch (const FilesystemError& e) {
    spdlog::warn("metadata: {}", e.what());
    sheet.problems.push_back({std::nullopt, 0, {}, e.what()});
    return sheet;
  }

  if (table.header.empty()) {
    sheet.problems.push_back({std::nullopt, 1, {}, "metadata file is empty (no header row)"});
    return sheet;
  }
  if (!table.headerValidUtf8) {
    sheet.problems.push_back({std::nullopt, 1, {}, "header row is not valid UTF-8"});
  }

  for (const auto& h : table.header) sheet.columns.push_back(schema.describe(h));

  const auto fnIt = std::find(table.header.begin(), table.header.end(), kFilenameColumn);
  const bool hasFilename = fnIt != table.header.end();
  const size_t fnCol = hasFilename ? static_cast<size_t>(fnIt - table.header.begin()) : 0;
  if (!hasFilename) {
    std::string cols;
    for (const auto& h : table.header) cols += (cols.empty() ? "" : ", ") + h;
    sheet.problems.push_back({std::nullopt, 1, {}, "no 'filename' column (columns: " + cols + ")"});
  }

  for (const auto& rec : table.records) {
    const size_t index = rowBase + sheet.rowCount;
    ++sheet.rowCount;

    std::string fname;
    if (hasFilename && fnCol < rec.fields.size()) fname = trim(rec.fields[fnCol]);

    auto bad = [&](const std::string& reason) {
      sheet.problems.push_back({index, rec.line, fname, reason});
    };

    if (!hasFilename)                      { bad("missing filename column"); continue; }
    if (!table.headerValidUtf8)            { bad("header is not valid UTF-8"); continue; }
    if (rec.unterminatedQuote)             { bad("unterminated quoted field"); continue; }
    if (!rec.validUtf8)                    { bad("row is not valid UTF-8"); continue; }
    if (rec.fields.size() != table.header.size()) {
      bad("has " + std::to_string(rec.fields.size()) + " columns, expected " +
          std::to_string(table.header.size()));
      continue;
    }
    if (fname.empty())                     { bad("empty filename field"); continue; }

    MetadataRow row;
    row.sourceFile = file;
    row.rowIndex = index;
    row.line = rec.line;
    row.values.reserve(rec.fields.size());
    for (size_t i = 0; i < rec.fields.size(); ++i) {
      row.values.emplace_back(table.header[i], trim(rec.fields[i]));
    }
    sheet.rows.push_back(std::move(row));
  }

  spdlog::debug("metadata: {} -> {} rows ({} problems)", file.string(), sheet.rowCount, sheet.problems.size());
  return sheet;
}

std::vector<MappedField> map_row(const MetadataRow& row, const std::vector<FieldDescriptor>& columns) {
  std::vector<MappedField> out;
  for (size_t i = 0; i < row.values.size() && i < columns.size(); ++i) {
    const auto& d = columns[i];
    if (d.kind == FieldKind::Filename) continue;
    if (row.values[i].second.empty()) continue;
    out.push_back({d, row.values[i].second});
  }
  return out;
}

} // namespace safs
