#include "PackageAssembler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <system_error>

#include "core/errors/Errors.hpp"
#include "core/events/ProgressEvent.hpp"
#include "core/package/DublinCore.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/util/Digest.hpp"

namespace safs {

namespace fs = std::filesystem;

static const char* kManifestFile = "manifest";
static const char* kContentsFile = "contents";
static const char* kExtensionsFile = "metadata_extensions.json";
static const char* kComponent    = "assemble";

const char* to_string(AssemblyStatus s) {
  switch (s) {
    case AssemblyStatus::Succeeded:            return "succeeded";
    case AssemblyStatus::ValidationGate:       return "validation_gate";
    case AssemblyStatus::PackageAlreadyExists: return "package_already_exists";
    case AssemblyStatus::FilesystemFailure:    return "filesystem_failure";
    case AssemblyStatus::Cancelled:            return "cancelled";
  }
  return "unknown";
}

nlohmann::json to_json(const AssemblyOutcome& o) {
  nlohmann::json pkgs = nlohmann::json::array();
  for (const auto& p : o.packages) pkgs.push_back(to_json(p));
  nlohmann::json j = {
    {"status", to_string(o.status)},
    {"directory", o.directory.string()},
    {"output", o.outputPath.string()},
    {"validation", to_json(o.report)},
    {"packages", pkgs},
    {"skipped", o.skipped}
  };
  if (!o.failedPackage.empty()) j["failed_package"] = o.failedPackage;
  if (!o.archive.empty()) j["archive"] = o.archive.string();
  if (!o.message.empty()) j["message"] = o.message;
  return j;
}

namespace {

struct PlannedPackage {
  std::string id;
  const MetadataRow* row;
  const std::vector<FieldDescriptor>* columns;
};

PackageDescriptor describe_row(const PlannedPackage& p, const fs::path& directory) {
  PackageDescriptor d;
  d.id = p.id;
  d.rowIndex = p.row->rowIndex;
  d.documentSource = fs::absolute(directory / p.row->filename());
  d.documentName = normalize_document_name(p.row->filename());

  for (auto& f : map_row(*p.row, *p.columns)) {
    if (f.descriptor.kind == FieldKind::Metadata) {
      d.entries.push_back({f.descriptor.schema, f.descriptor.element, f.descriptor.qualifier,
                           f.descriptor.language, std::move(f.value)});
    } else {
      d.extensions.emplace_back(f.descriptor.column, std::move(f.value));
    }
  }
  return d;
}

// dc first, then the remaining schemas in table order.
std::vector<std::string> schema_order(const PackageDescriptor& d, const SchemaTable& table) {
  std::vector<std::string> order {"dc"};
  for (const auto& s : table.schemas()) {
    if (s == "dc") continue;
    const bool used = std::any_of(d.entries.begin(), d.entries.end(),
                                  [&](const DescriptorEntry& e) { return e.schema == s; });
    if (used) order.push_back(s);
  }
  return order;
}

// Columns outside the schema table, in column order: [{"column", "value"}, ...]
std::string render_extensions(const PackageDescriptor& d) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& [column, value] : d.extensions) arr.push_back({{"column", column}, {"value", value}});
  return arr.dump(2) + "\n";
}

std::vector<std::pair<std::string, std::string>> parse_extensions(const fs::path& file) {
  std::ifstream in(file);
  if (!in) throw FilesystemError("cannot open " + file.string());
  std::vector<std::pair<std::string, std::string>> out;
  try {
    for (const auto& item : nlohmann::json::parse(in)) {
      out.emplace_back(item.at("column").get<std::string>(), item.at("value").get<std::string>());
    }
  } catch (const nlohmann::json::exception& e) {
    throw FilesystemError("malformed " + file.string() + ": " + e.what());
  }
  return out;
}

void write_package(LocalFSBackend& out, PackageDescriptor& d, const SchemaTable& table, bool digest) {
  const std::vector<std::string> reserved {kManifestFile, kContentsFile, kExtensionsFile};
  if (d.documentName.empty() || std::find(reserved.begin(), reserved.end(), d.documentName) != reserved.end()) {
    throw FilesystemError("unusable document name for " + d.id + ": '" + d.documentName + "'");
  }

  const fs::path staging = out.beginStaging(d.id);
  try {
    PackageManifest manifest;
    std::vector<DescriptorEntry> grouped;
    for (const auto& schema : schema_order(d, table)) {
      std::vector<DescriptorEntry> entries;
      for (const auto& e : d.entries) {
        if (e.schema == schema) entries.push_back(e);
      }
      const std::string name = SchemaTable::descriptorFile(schema);
      out.put(staging, name, render_descriptor(schema, entries));
      manifest.files.push_back(name);
      grouped.insert(grouped.end(), entries.begin(), entries.end());
    }
    // Entries now follow descriptor file order, as read_package() returns them.
    d.entries = std::move(grouped);

    if (!d.extensions.empty()) {
      out.put(staging, kExtensionsFile, render_extensions(d));
      manifest.files.push_back(kExtensionsFile);
    }

    out.copyIn(staging, d.documentSource, d.documentName);
    manifest.files.push_back(d.documentName);
    if (digest) d.documentSha256 = sha256_file_hex(staging / d.documentName);

    out.put(staging, kContentsFile, d.documentName + "\n");
    out.put(staging, kManifestFile, render_manifest(manifest));

    d.manifest = std::move(manifest);
    d.packageDir = out.commit(staging, d.id);
  } catch (...) {
    out.discard(staging);
    throw;
  }
}

// Empty when the package at dir was built from the same document as row;
// otherwise the reason it belongs to another row.
std::string foreign_package_reason(const fs::path& dir, const MetadataRow& row,
                                   const fs::path& directory, bool digest) {
  const auto manifest = parse_manifest(dir / kManifestFile);
  const std::string expected = normalize_document_name(row.filename());
  if (manifest.document() != expected) {
    return "holds '" + manifest.document() + "', row " + std::to_string(row.rowIndex) +
           " needs '" + expected + "'";
  }
  if (digest && sha256_file_hex(dir / expected) != sha256_file_hex(directory / row.filename())) {
    return "holds a different '" + expected + "' than " + (directory / row.filename()).string();
  }
  return {};
}

} // namespace

PackageAssembler::PackageAssembler(ConsistencyValidator validator, PackageOptions opts)
  : validator_(std::move(validator)), opts_(std::move(opts)) {}

std::string PackageAssembler::packageId(size_t ordinal) const {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%0*zu", opts_.idWidth, opts_.idBase + ordinal);
  return opts_.idPrefix + buf;
}

AssemblyOutcome PackageAssembler::assemble(const fs::path& directory,
                                           const fs::path& outputPath,
                                           const CancellationToken& cancel,
                                           EventBus* events) const {
  AssemblyOutcome outcome;
  outcome.directory = directory;
  outcome.outputPath = outputPath;

  ValidationResult validated;
  try {
    validated = validator_.run(directory);
  } catch (const FilesystemError& e) {
    outcome.status = AssemblyStatus::FilesystemFailure;
    outcome.message = e.what();
    spdlog::error("assemble {}: {}", directory.string(), e.what());
    if (events) events->emit(kComponent, EventKind::ItemFailed, directory.string(), 0, 0, false, outcome.message);
    return outcome;
  }
  outcome.report = validated.report;
  if (!outcome.report.passesGate()) {
    outcome.status = AssemblyStatus::ValidationGate;
    outcome.message = std::to_string(outcome.report.blockingCount()) + " blocking validation issue(s)";
    spdlog::warn("assemble {}: refused, {}", directory.string(), outcome.message);
    if (events) events->emit(kComponent, EventKind::ItemFailed, directory.string(), 0, 0, false, outcome.message);
    return outcome;
  }

  std::vector<PlannedPackage> plan;
  for (const auto& sheet : validated.sheets) {
    for (const auto& row : sheet.rows) plan.push_back({packageId(plan.size()), &row, &sheet.columns});
  }

  // Pre-flight: decide every existing target before the first write.
  LocalFSBackend out(outputPath);
  std::vector<bool> skip(plan.size(), false);
  for (size_t i = 0; i < plan.size(); ++i) {
    const auto& id = plan[i].id;
    if (!out.exists(id)) continue;
    std::string reason;
    if (opts_.existing == ExistingPackagePolicy::Skip && is_complete_package(out.packageDir(id))) {
      try {
        reason = foreign_package_reason(out.packageDir(id), *plan[i].row, directory, opts_.computeDigest);
      } catch (const FilesystemError& e) {
        reason = e.what();
      }
      if (reason.empty()) {
        skip[i] = true;
        continue;
      }
    }
    outcome.status = AssemblyStatus::PackageAlreadyExists;
    outcome.failedPackage = id;
    outcome.message = PackageAlreadyExistsError(id).what();
    if (!reason.empty()) outcome.message += ": " + reason;
    spdlog::error("assemble {}: {}", directory.string(), outcome.message);
    if (events) events->emit(kComponent, EventKind::ItemFailed, id, 0, plan.size(), false, outcome.message);
    return outcome;
  }

  const auto total = static_cast<uint64_t>(plan.size());
  if (events) events->emit(kComponent, EventKind::Started, directory.string(), 0, total);

  try {
    out.prepare();
  } catch (const std::exception& e) {
    outcome.status = AssemblyStatus::FilesystemFailure;
    outcome.message = e.what();
    spdlog::error("assemble {}: {}", directory.string(), e.what());
    return outcome;
  }

  for (size_t i = 0; i < plan.size(); ++i) {
    const auto& p = plan[i];
    if (cancel.cancelled()) {
      outcome.status = AssemblyStatus::Cancelled;
      outcome.message = "cancelled after " + std::to_string(i) + " of " + std::to_string(plan.size());
      spdlog::warn("assemble {}: {}", directory.string(), outcome.message);
      return outcome;
    }
    if (skip[i]) {
      outcome.skipped.push_back(p.id);
      spdlog::info("  = {}  {} (already built)", p.id, p.row->filename());
      if (events) events->emit(kComponent, EventKind::ItemSkipped, p.id, i + 1, total);
      continue;
    }

    PackageDescriptor d;
    try {
      d = describe_row(p, directory);
      write_package(out, d, validator_.schema(), opts_.computeDigest);
    } catch (const PackageAlreadyExistsError& e) {
      outcome.status = AssemblyStatus::PackageAlreadyExists;
      outcome.failedPackage = p.id;
      outcome.message = e.what();
    } catch (const std::exception& e) {
      outcome.status = AssemblyStatus::FilesystemFailure;
      outcome.failedPackage = p.id;
      outcome.message = e.what();
    }
    if (!outcome.failedPackage.empty()) {
      spdlog::error("assemble {}: {} failed after {} package(s): {}", directory.string(), p.id,
                    outcome.packages.size(), outcome.message);
      if (events) events->emit(kComponent, EventKind::ItemFailed, p.id, i + 1, total, false, outcome.message);
      return outcome;
    }

    spdlog::info("  + {}  {}", d.id, d.documentName);
    if (events) events->emit(kComponent, EventKind::ItemSucceeded, d.id, i + 1, total);
    outcome.packages.push_back(std::move(d));
  }

  outcome.status = AssemblyStatus::Succeeded;
  spdlog::info("assemble {}: {} written, {} skipped -> {}", directory.string(), outcome.packages.size(),
               outcome.skipped.size(), outputPath.string());
  if (events) events->emit(kComponent, EventKind::Finished, directory.string(), total, total);
  return outcome;
}

bool is_complete_package(const fs::path& dir) {
  std::error_code ec;
  if (!fs::is_regular_file(dir / kManifestFile, ec)) return false;
  try {
    const auto m = parse_manifest(dir / kManifestFile);
    for (const auto& f : m.files) {
      if (!fs::is_regular_file(dir / f, ec)) return false;
    }
    return fs::is_regular_file(dir / kContentsFile, ec);
  } catch (const FilesystemError& e) {
    spdlog::warn("package {} has an unreadable manifest: {}", dir.string(), e.what());
    return false;
  }
}

bool looks_like_package(const fs::path& dir) {
  std::error_code ec;
  return fs::is_regular_file(dir / kManifestFile, ec) || fs::is_regular_file(dir / kContentsFile, ec) ||
         fs::is_regular_file(dir / SchemaTable::descriptorFile("dc"), ec);
}

std::vector<std::string> package_files(const fs::path& dir) {
  if (!is_complete_package(dir)) throw FilesystemError("incomplete package: " + dir.string());
  auto files = parse_manifest(dir / kManifestFile).files;
  files.push_back(kContentsFile);
  files.push_back(kManifestFile);
  return files;
}

PackageDescriptor read_package(const fs::path& dir) {
  PackageDescriptor d;
  d.id = dir.filename().string();
  d.packageDir = dir;
  d.manifest = parse_manifest(dir / kManifestFile);
  d.documentName = d.manifest.document();
  for (size_t i = 0; i + 1 < d.manifest.files.size(); ++i) {
    const auto& name = d.manifest.files[i];
    if (name == kExtensionsFile) {
      d.extensions = parse_extensions(dir / name);
      continue;
    }
    auto entries = parse_descriptor(dir / name);
    d.entries.insert(d.entries.end(), entries.begin(), entries.end());
  }
  d.documentSource = dir / d.documentName;
  return d;
}

} // namespace safs
