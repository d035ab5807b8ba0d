#include "BatchAssembler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <mutex>
#include <optional>

#include "core/errors/Errors.hpp"
#include "core/events/ProgressEvent.hpp"
#include "core/package/ZipArchive.hpp"
#include "core/util/WorkerPool.hpp"

namespace safs {

namespace fs = std::filesystem;

size_t BatchReport::count(AssemblyStatus s) const {
  return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                           [s](const AssemblyOutcome& o) { return o.status == s; }));
}

bool BatchReport::allSucceeded() const {
  return scanErrors.empty() && count(AssemblyStatus::Succeeded) == outcomes.size();
}

nlohmann::json to_json(const BatchReport& r) {
  nlohmann::json dirs = nlohmann::json::array();
  for (const auto& o : r.outcomes) dirs.push_back(to_json(o));
  nlohmann::json errs = nlohmann::json::array();
  for (const auto& e : r.scanErrors) {
    errs.push_back({{"directory", e.directory.string()}, {"reason", e.reason}, {"access_denied", e.accessDenied}});
  }
  return {
    {"root", r.root.string()},
    {"output_root", r.outputRoot.string()},
    {"directories", r.outcomes.size()},
    {"succeeded", r.count(AssemblyStatus::Succeeded)},
    {"gate_failed", r.count(AssemblyStatus::ValidationGate)},
    {"already_exists", r.count(AssemblyStatus::PackageAlreadyExists)},
    {"filesystem_failed", r.count(AssemblyStatus::FilesystemFailure)},
    {"cancelled", r.count(AssemblyStatus::Cancelled)},
    {"scan_errors", errs},
    {"outcomes", dirs}
  };
}

bool BatchValidation::allPass() const {
  if (!scanErrors.empty() || !failures.empty()) return false;
  return std::all_of(reports.begin(), reports.end(),
                     [](const ValidationReport& r) { return r.passesGate(); });
}

nlohmann::json to_json(const BatchValidation& v) {
  nlohmann::json reports = nlohmann::json::array();
  for (const auto& r : v.reports) reports.push_back(to_json(r));
  nlohmann::json errs = nlohmann::json::array();
  for (const auto& e : v.scanErrors) {
    errs.push_back({{"directory", e.directory.string()}, {"reason", e.reason}, {"access_denied", e.accessDenied}});
  }
  nlohmann::json failures = nlohmann::json::array();
  for (const auto& [dir, reason] : v.failures) {
    failures.push_back({{"directory", dir.string()}, {"reason", reason}});
  }
  return {
    {"directories", v.reports.size()},
    {"passing", v.allPass()},
    {"reports", reports},
    {"scan_errors", errs},
    {"failures", failures}
  };
}

BatchAssembler::BatchAssembler(PackageAssembler assembler, ScanOptions scan, BatchOptions opts)
  : assembler_(std::move(assembler)), scan_(std::move(scan)), opts_(std::move(opts)) {
  if (std::find(scan_.skipDirNames.begin(), scan_.skipDirNames.end(), opts_.outputDirName) == scan_.skipDirNames.end()) {
    scan_.skipDirNames.push_back(opts_.outputDirName);
  }
}

fs::path BatchAssembler::outputFor(const fs::path& root, const ScanEntry& entry, const fs::path& outputRoot) const {
  const fs::path abs = fs::absolute(root).lexically_normal();
  fs::path name = abs.filename();
  if (name.empty()) name = abs.parent_path().filename();
  fs::path rel = entry.relativePath;
  if (rel.empty() || rel == ".") return outputRoot / name / opts_.outputDirName;
  return outputRoot / name / rel / opts_.outputDirName;
}

BatchReport BatchAssembler::run(const fs::path& root,
                                const fs::path& outputRoot,
                                const CancellationToken& cancel,
                                EventBus* events) const {
  BatchReport report;
  report.root = root;
  report.outputRoot = outputRoot;

  const auto entries = scan_all(root, scan_, &report.scanErrors);
  report.outcomes.resize(entries.size());
  spdlog::info("batch: {} director{} with metadata under {}", entries.size(),
               entries.size() == 1 ? "y" : "ies", root.string());
  if (events) events->emit("batch", EventKind::Started, root.string(), 0, entries.size());

  std::mutex doneMu;
  uint64_t done = 0;
  {
    WorkerPool pool(opts_.workers);
    for (size_t i = 0; i < entries.size(); ++i) {
      const auto& entry = entries[i];
      AssemblyOutcome& slot = report.outcomes[i];
      slot.directory = entry.directory;
      slot.outputPath = outputFor(root, entry, outputRoot);

      if (cancel.cancelled()) {
        slot.status = AssemblyStatus::Cancelled;
        slot.message = "batch cancelled before start";
        continue;
      }
      pool.submit([&, i] {
        AssemblyOutcome& out = report.outcomes[i];
        if (cancel.cancelled()) {
          out.status = AssemblyStatus::Cancelled;
          out.message = "batch cancelled before start";
        } else {
          const fs::path target = out.outputPath;
          try {
            out = assembler_.assemble(entries[i].directory, target, cancel, events);
            if (out.ok() && opts_.zip) {
              const fs::path archive = target.parent_path() / (target.filename().string() + ".zip");
              zip_directory(target, archive);
              out.archive = archive;
            }
          } catch (const std::exception& e) {
            out.status = AssemblyStatus::FilesystemFailure;
            out.directory = entries[i].directory;
            out.outputPath = target;
            out.message = e.what();
            spdlog::error("batch: {}: {}", entries[i].directory.string(), e.what());
          }
        }
        std::lock_guard<std::mutex> lk(doneMu);
        ++done;
        if (events) {
          events->emit("batch", out.ok() ? EventKind::ItemSucceeded : EventKind::ItemFailed,
                       entries[i].directory.string(), done, entries.size(), out.ok(), to_string(out.status));
        }
      });
    }
    pool.wait();
  }

  spdlog::info("batch: {}/{} directories succeeded ({} gate, {} exists, {} filesystem, {} cancelled)",
               report.count(AssemblyStatus::Succeeded), report.outcomes.size(),
               report.count(AssemblyStatus::ValidationGate), report.count(AssemblyStatus::PackageAlreadyExists),
               report.count(AssemblyStatus::FilesystemFailure), report.count(AssemblyStatus::Cancelled));

  if (opts_.writeReport && !report.outcomes.empty()) {
    std::error_code ec;
    fs::create_directories(outputRoot, ec);
    std::ofstream out(outputRoot / "batch_report.json");
    if (out) out << to_json(report).dump(2) << "\n";
    if (ec || !out) spdlog::warn("batch: could not write batch_report.json under {}", outputRoot.string());
  }
  if (events) events->emit("batch", EventKind::Finished, root.string(), entries.size(), entries.size(),
                           report.allSucceeded());
  return report;
}

BatchValidation BatchAssembler::validateAll(const fs::path& root,
                                            const CancellationToken& cancel,
                                            EventBus* events) const {
  BatchValidation result;
  const auto entries = scan_all(root, scan_, &result.scanErrors);
  std::vector<std::optional<ValidationReport>> slots(entries.size());
  std::vector<std::string> errors(entries.size());

  {
    WorkerPool pool(opts_.workers);
    for (size_t i = 0; i < entries.size() && !cancel.cancelled(); ++i) {
      pool.submit([&, i] {
        if (cancel.cancelled()) return;
        try {
          slots[i] = assembler_.validator().validate(entries[i].directory);
          if (events) {
            events->emit("validate", slots[i]->passesGate() ? EventKind::ItemSucceeded : EventKind::ItemFailed,
                         entries[i].directory.string(), 0, 0, slots[i]->passesGate(),
                         std::to_string(slots[i]->issues.size()) + " issue(s)");
          }
        } catch (const FilesystemError& e) {
          errors[i] = e.what();
          spdlog::error("validate {}: {}", entries[i].directory.string(), e.what());
          if (events) events->emit("validate", EventKind::ItemFailed, entries[i].directory.string(), 0, 0, false, e.what());
        }
      });
    }
    pool.wait();
  }

  for (size_t i = 0; i < entries.size(); ++i) {
    if (slots[i]) result.reports.push_back(std::move(*slots[i]));
    else if (!errors[i].empty()) result.failures.emplace_back(entries[i].directory, errors[i]);
  }
  return result;
}

} // namespace safs
