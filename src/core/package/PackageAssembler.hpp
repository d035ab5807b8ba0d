#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "core/package/PackageDescriptor.hpp"
#include "core/util/Cancellation.hpp"
#include "core/validation/ConsistencyValidator.hpp"

namespace safs {

class EventBus;

enum class ExistingPackagePolicy {
  Skip,  // keep a complete existing package built from the same document, fail otherwise
  Fail   // any existing target fails the directory
};

struct PackageOptions {
  std::string idPrefix = "item_";
  int idWidth = 3;
  size_t idBase = 0;
  ExistingPackagePolicy existing = ExistingPackagePolicy::Skip;
  bool computeDigest = true;
};

enum class AssemblyStatus {
  Succeeded,
  ValidationGate,
  PackageAlreadyExists,
  FilesystemFailure,
  Cancelled
};

const char* to_string(AssemblyStatus s);

struct AssemblyOutcome {
  AssemblyStatus status = AssemblyStatus::FilesystemFailure;  // set on every exit of assemble()
  std::filesystem::path directory;
  std::filesystem::path outputPath;
  ValidationReport report;
  std::vector<PackageDescriptor> packages;  // written by this run, in row order
  std::vector<std::string> skipped;         // complete packages left untouched
  std::string failedPackage;
  std::string message;
  std::filesystem::path archive;            // <outputPath>.zip when zipping is enabled

  bool ok() const { return status == AssemblyStatus::Succeeded; }
};

nlohmann::json to_json(const AssemblyOutcome& o);

// Turns a validated directory into SAF item directories. Nothing is written
// unless the validation gate passes and every target package is either new
// or (with Skip) already complete.
class PackageAssembler {
public:
  PackageAssembler(ConsistencyValidator validator, PackageOptions opts = {});

  AssemblyOutcome assemble(const std::filesystem::path& directory,
                           const std::filesystem::path& outputPath,
                           const CancellationToken& cancel = {},
                           EventBus* events = nullptr) const;

  std::string packageId(size_t ordinal) const;

  const ConsistencyValidator& validator() const { return validator_; }

private:
  ConsistencyValidator validator_;
  PackageOptions opts_;
};

// True when dir holds a manifest and every file it lists.
bool is_complete_package(const std::filesystem::path& dir);

// True when dir holds any package marker (manifest, contents, dublin_core.xml).
bool looks_like_package(const std::filesystem::path& dir);

// Relative names of every file a complete package consists of: the manifest
// entries, then contents and manifest. Throws FilesystemError when incomplete.
std::vector<std::string> package_files(const std::filesystem::path& dir);

// Reads a package directory back into a descriptor (entries from every
// descriptor file listed in the manifest, opaque columns from
// metadata_extensions.json, document name from the manifest).
PackageDescriptor read_package(const std::filesystem::path& dir);

} // namespace safs
