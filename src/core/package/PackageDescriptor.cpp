#include "PackageDescriptor.hpp"

namespace safs {

bool operator==(const DescriptorEntry& a, const DescriptorEntry& b) {
  return a.schema == b.schema && a.element == b.element && a.qualifier == b.qualifier &&
         a.language == b.language && a.value == b.value;
}

nlohmann::json to_json(const PackageDescriptor& p) {
  nlohmann::json fields = nlohmann::json::array();
  for (const auto& e : p.entries) {
    nlohmann::json f = {{"schema", e.schema}, {"element", e.element}, {"value", e.value}};
    if (e.qualifier) f["qualifier"] = *e.qualifier;
    if (e.language) f["language"] = *e.language;
    fields.push_back(std::move(f));
  }
  nlohmann::json ext = nlohmann::json::object();
  for (const auto& kv : p.extensions) ext[kv.first] = kv.second;

  return {
    {"id", p.id},
    {"row", p.rowIndex},
    {"package_dir", p.packageDir.string()},
    {"document", p.documentName},
    {"document_source", p.documentSource.string()},
    {"document_sha256", p.documentSha256},
    {"manifest", p.manifest.files},
    {"fields", fields},
    {"extensions", ext}
  };
}

std::string normalize_document_name(const std::string& filename) {
  std::string name = filename;
  const auto slash = name.find_last_of("/\\");
  if (slash != std::string::npos) name = name.substr(slash + 1);

  const auto b = name.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = name.find_last_not_of(" \t\r\n");
  name = name.substr(b, e - b + 1);

  for (auto& c : name) {
    const auto u = static_cast<unsigned char>(c);
    if (u < 0x20 || u == 0x7F || c == ':') c = '_';
  }
  if (name == "." || name == "..") name = "_";
  return name;
}

} // namespace safs
