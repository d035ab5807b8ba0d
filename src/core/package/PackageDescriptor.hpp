#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace safs {

// One metadata value as it lands in a descriptor file.
struct DescriptorEntry {
  std::string schema;
  std::string element;
  std::optional<std::string> qualifier;
  std::optional<std::string> language;
  std::string value;
};

bool operator==(const DescriptorEntry& a, const DescriptorEntry& b);

// Relative file names in a package: descriptor files first, document last.
struct PackageManifest {
  std::vector<std::string> files;

  const std::string& document() const { return files.back(); }
};

struct PackageDescriptor {
  std::string id;                                   // item_000
  std::vector<DescriptorEntry> entries;             // column order
  std::vector<std::pair<std::string, std::string>> extensions; // opaque columns
  std::filesystem::path documentSource;             // absolute path of the source document
  std::string documentName;                         // name inside the package
  std::string documentSha256;
  std::filesystem::path packageDir;
  PackageManifest manifest;
  size_t rowIndex = 0;
};

nlohmann::json to_json(const PackageDescriptor& p);

// Strips directory components and surrounding whitespace; replaces control
// characters, tabs and path separators with '_'.
std::string normalize_document_name(const std::string& filename);

} // namespace safs
