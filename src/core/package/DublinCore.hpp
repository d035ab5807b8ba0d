#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "core/package/PackageDescriptor.hpp"

namespace safs {

// Serializes the entries of one schema as a DSpace descriptor:
//   <dublin_core schema="dc">
//     <dcvalue element="title" language="en">X</dcvalue>
//   </dublin_core>
std::string render_descriptor(const std::string& schema, const std::vector<DescriptorEntry>& entries);

// Parses a descriptor file back into entries (document order). A qualifier of
// "none" is read as no qualifier. Throws FilesystemError on unreadable or
// malformed XML.
std::vector<DescriptorEntry> parse_descriptor(const std::filesystem::path& file);

std::string render_manifest(const PackageManifest& m);
PackageManifest parse_manifest(const std::filesystem::path& file);

} // namespace safs
