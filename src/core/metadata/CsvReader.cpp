#include "CsvReader.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>

#include "core/errors/Errors.hpp"

namespace safs {

bool is_valid_utf8(std::string_view s) {
  size_t i = 0;
  const size_t n = s.size();
  while (i < n) {
    const auto c = static_cast<unsigned char>(s[i]);
    size_t len = 0;
    uint32_t cp = 0;
    if (c < 0x80)                { ++i; continue; }
    else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
    else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
    else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
    else return false;

    if (i + len > n) return false;
    for (size_t k = 1; k < len; ++k) {
      const auto cc = static_cast<unsigned char>(s[i + k]);
      if ((cc & 0xC0) != 0x80) return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    // overlong forms, surrogates, out of range
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
    if (cp >= 0xD800 && cp <= 0xDFFF) return false;
    if (cp > 0x10FFFF) return false;
    i += len;
  }
  return true;
}

static std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

CsvTable parse_csv(std::string_view text, char sep) {
  if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
      static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF) {
    text.remove_prefix(3);
  }

  std::vector<CsvRecord> all;
  CsvRecord rec;
  std::string field;
  bool inQuotes = false;
  bool fieldStarted = false;
  size_t line = 1;
  rec.line = 1;

  auto endField = [&]() {
    rec.fields.push_back(std::move(field));
    field.clear();
    fieldStarted = false;
  };
  auto endRecord = [&]() {
    endField();
    const bool blank = rec.fields.size() == 1 && rec.fields[0].empty();
    if (!blank) all.push_back(std::move(rec));
    rec = CsvRecord{};
    rec.line = line;
  };

  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (inQuotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') { field.push_back('"'); ++i; }
        else inQuotes = false;
      } else {
        if (c == '\n') ++line;
        field.push_back(c);
      }
      continue;
    }
    if (c == '"' && !fieldStarted) { inQuotes = true; fieldStarted = true; continue; }
    if (c == sep) { endField(); continue; }
    if (c == '\r') {
      if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
      ++line;
      endRecord();
      continue;
    }
    if (c == '\n') { ++line; endRecord(); continue; }
    field.push_back(c);
    fieldStarted = true;
  }
  if (inQuotes) rec.unterminatedQuote = true;
  if (!field.empty() || fieldStarted || !rec.fields.empty() || rec.unterminatedQuote) endRecord();

  for (auto& r : all) {
    for (const auto& f : r.fields) {
      if (!is_valid_utf8(f)) { r.validUtf8 = false; break; }
    }
  }

  CsvTable table;
  if (all.empty()) return table;
  table.headerValidUtf8 = all.front().validUtf8;
  for (auto& h : all.front().fields) table.header.push_back(trim(h));
  table.records.assign(std::make_move_iterator(all.begin() + 1), std::make_move_iterator(all.end()));
  return table;
}

CsvTable read_csv_file(const std::filesystem::path& file, char sep) {
  std::ifstream in(file, std::ios::binary);
  if (!in) throw FilesystemError("cannot open metadata file: " + file.string());
  std::ostringstream buf; buf << in.rdbuf();
  if (in.bad()) throw FilesystemError("read failed: " + file.string());
  return parse_csv(buf.str(), sep);
}

std::string csv_escape(std::string_view cell, char sep) {
  const bool needs = cell.find_first_of(std::string{sep, '"', '\r', '\n'}) != std::string_view::npos;
  if (!needs) return std::string(cell);
  std::string out = "\"";
  for (char c : cell) {
    if (c == '"') out += "\"\"";
    else out.push_back(c);
  }
  out.push_back('"');
  return out;
}

} // namespace safs
