#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace safs {

struct CsvRecord {
  size_t line = 0;                  // 1-based physical line where the record starts
  std::vector<std::string> fields;
  bool validUtf8 = true;
  bool unterminatedQuote = false;
};

struct CsvTable {
  std::vector<std::string> header;  // empty when the file has no header row
  bool headerValidUtf8 = true;
  std::vector<CsvRecord> records;   // blank lines are dropped
};

bool is_valid_utf8(std::string_view s);

// RFC 4180 reader: quoted fields may hold separators, CR/LF and doubled
// quotes. A leading UTF-8 BOM is dropped. Header cells are trimmed.
CsvTable parse_csv(std::string_view text, char sep = ',');

// Throws FilesystemError when the file cannot be read.
CsvTable read_csv_file(const std::filesystem::path& file, char sep = ',');

// Minimal quoting for writing one CSV cell.
std::string csv_escape(std::string_view cell, char sep = ',');

} // namespace safs
