#pragma once
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "core/package/PackageAssembler.hpp"
#include "core/scan/DirectoryScanner.hpp"

namespace safs {

class EventBus;

struct BatchOptions {
  size_t workers = 4;
  std::string outputDirName = "SimpleArchiveFormat";
  bool writeReport = true;  // batch_report.json in the output root
  bool zip = false;         // <outputDirName>.zip beside each successful output
};

struct BatchReport {
  std::filesystem::path root;
  std::filesystem::path outputRoot;
  std::vector<AssemblyOutcome> outcomes;   // scan order
  std::vector<ScanError> scanErrors;

  size_t count(AssemblyStatus s) const;
  bool allSucceeded() const;
};

nlohmann::json to_json(const BatchReport& r);

struct BatchValidation {
  std::vector<ValidationReport> reports;     // scan order
  std::vector<ScanError> scanErrors;
  std::vector<std::pair<std::filesystem::path, std::string>> failures; // unreadable directories

  bool allPass() const;
};

nlohmann::json to_json(const BatchValidation& v);

// Runs validate + assemble for every candidate directory under a root on a
// bounded worker pool. Each directory is owned by exactly one worker and its
// failure never affects the others.
class BatchAssembler {
public:
  BatchAssembler(PackageAssembler assembler, ScanOptions scan = {}, BatchOptions opts = {});

  BatchReport run(const std::filesystem::path& root,
                  const std::filesystem::path& outputRoot,
                  const CancellationToken& cancel = {},
                  EventBus* events = nullptr) const;

  BatchValidation validateAll(const std::filesystem::path& root,
                              const CancellationToken& cancel = {},
                              EventBus* events = nullptr) const;

  // outputRoot/<root name>/<relative dir>/<outputDirName>. The scan root itself
  // maps to outputRoot/<root name>/<outputDirName>.
  std::filesystem::path outputFor(const std::filesystem::path& root,
                                  const ScanEntry& entry,
                                  const std::filesystem::path& outputRoot) const;

private:
  PackageAssembler assembler_;
  ScanOptions scan_;
  BatchOptions opts_;
};

} // namespace safs
