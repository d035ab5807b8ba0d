#include "DublinCore.hpp"

#include <pugixml.hpp>

#include <fstream>
#include <sstream>

#include "core/errors/Errors.hpp"

namespace safs {

std::string render_descriptor(const std::string& schema, const std::vector<DescriptorEntry>& entries) {
  pugi::xml_document doc;
  auto decl = doc.append_child(pugi::node_declaration);
  decl.append_attribute("version") = "1.0";
  decl.append_attribute("encoding") = "UTF-8";

  auto root = doc.append_child("dublin_core");
  root.append_attribute("schema") = schema.c_str();

  for (const auto& e : entries) {
    auto v = root.append_child("dcvalue");
    v.append_attribute("element") = e.element.c_str();
    if (e.qualifier) v.append_attribute("qualifier") = e.qualifier->c_str();
    if (e.language) v.append_attribute("language") = e.language->c_str();
    v.append_child(pugi::node_pcdata).set_value(e.value.c_str());
  }

  std::ostringstream out;
  doc.save(out, "  ", pugi::format_default, pugi::encoding_utf8);
  return out.str();
}

std::vector<DescriptorEntry> parse_descriptor(const std::filesystem::path& file) {
  pugi::xml_document doc;
  const auto res = doc.load_file(file.c_str());
  if (!res) throw FilesystemError("cannot parse descriptor " + file.string() + ": " + res.description());

  auto root = doc.child("dublin_core");
  if (!root) throw FilesystemError("descriptor without <dublin_core> root: " + file.string());
  const std::string schema = root.attribute("schema").as_string("dc");

  std::vector<DescriptorEntry> out;
  for (auto v : root.children("dcvalue")) {
    DescriptorEntry e;
    e.schema = schema;
    e.element = v.attribute("element").as_string();
    if (auto q = v.attribute("qualifier")) {
      const std::string qs = q.as_string();
      if (!qs.empty() && qs != "none") e.qualifier = qs;
    }
    if (auto l = v.attribute("language")) {
      const std::string ls = l.as_string();
      if (!ls.empty()) e.language = ls;
    }
    e.value = v.text().as_string();
    out.push_back(std::move(e));
  }
  return out;
}

std::string render_manifest(const PackageManifest& m) {
  std::string out;
  for (const auto& f : m.files) out += f + "\n";
  return out;
}

PackageManifest parse_manifest(const std::filesystem::path& file) {
  std::ifstream in(file);
  if (!in) throw FilesystemError("cannot open manifest " + file.string());
  PackageManifest m;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!line.empty()) m.files.push_back(line);
  }
  if (m.files.empty()) throw FilesystemError("empty manifest " + file.string());
  return m;
}

} // namespace safs
