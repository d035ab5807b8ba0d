#include "TreeUploader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "core/errors/Errors.hpp"
#include "core/package/PackageAssembler.hpp"
#include "core/storage/LocalFSBackend.hpp"

using nlohmann::json;

namespace safs {

namespace fs = std::filesystem;

json to_json(const TreeUploadReport& r) {
  json results = json::array();
  for (const auto& f : r.results) results.push_back(to_json(f));
  return {
    {"source_dir", r.sourceDir},
    {"container", r.container},
    {"total", r.total},
    {"succeeded", r.succeeded},
    {"aborted", r.aborted},
    {"results", results}
  };
}

std::string TreeUploader::objectNameFor(const fs::path& sourceDir, const fs::path& file) {
  fs::path base = sourceDir;
  if (!base.has_filename()) base = base.parent_path();  // trailing separator
  return file.lexically_relative(base.parent_path()).generic_string();
}

static void add_package(const fs::path& dir, TreeListing& out) {
  if (!is_complete_package(dir)) {
    out.incompletePackages.push_back(dir);
    return;
  }
  for (const auto& name : package_files(dir)) out.files.push_back(dir / name);
}

TreeListing TreeUploader::collect(const fs::path& sourceDir) const {
  std::error_code ec;
  if (!fs::is_directory(sourceDir, ec))
    throw FilesystemError("not a directory: " + sourceDir.string());

  TreeListing listing;
  if (looks_like_package(sourceDir)) {
    add_package(sourceDir, listing);
    std::sort(listing.files.begin(), listing.files.end());
    return listing;
  }

  fs::recursive_directory_iterator it(sourceDir, ec), end;
  if (ec) throw FilesystemError("cannot read " + sourceDir.string() + ": " + ec.message());
  while (it != end) {
    const auto name = it->path().filename().string();
    const bool hidden = skipHidden_ && !name.empty() && name[0] == '.';
    if (it->is_directory(ec)) {
      if (hidden || LocalFSBackend::isStagingName(name)) {
        it.disable_recursion_pending();
      } else if (looks_like_package(it->path())) {
        it.disable_recursion_pending();
        add_package(it->path(), listing);
      }
    } else if (!hidden && it->is_regular_file(ec)) {
      listing.files.push_back(it->path());
    }
    it.increment(ec);
    if (ec) throw FilesystemError("cannot read " + sourceDir.string() + ": " + ec.message());
  }
  std::sort(listing.files.begin(), listing.files.end());
  std::sort(listing.incompletePackages.begin(), listing.incompletePackages.end());
  return listing;
}

TreeUploadReport TreeUploader::uploadDirectory(const fs::path& sourceDir,
                                               const std::string& container,
                                               const CancellationToken& cancel) {
  TreeUploadReport report;
  report.sourceDir = sourceDir.string();
  report.container = container;

  const auto listing = collect(sourceDir);
  report.total = listing.files.size() + listing.incompletePackages.size();
  for (const auto& dir : listing.incompletePackages) {
    FileUploadResult r;
    r.status = FileUploadStatus::Failed;
    r.objectKey = objectNameFor(sourceDir, dir);
    r.message = "incomplete package: manifest missing or lists absent files";
    spdlog::error("not uploading {}: {}", dir.string(), r.message);
    report.results.push_back(std::move(r));
  }
  pipeline_.ensureContainer(container);

  spdlog::info("uploading {} file(s) from {} to container '{}'", listing.files.size(), sourceDir.string(), container);
  for (const auto& file : listing.files) {
    if (cancel.cancelled()) {
      report.aborted = true;
      spdlog::info("tree upload cancelled after {}/{} files", report.succeeded, report.total);
      break;
    }
    auto r = pipeline_.uploadFile(container, objectNameFor(sourceDir, file), file, cancel);
    if (r.ok()) ++report.succeeded;
    const bool authFailed = r.transport == TransportStatus::AuthFailed;
    report.results.push_back(std::move(r));
    if (authFailed) {
      report.aborted = true;
      spdlog::error("authorization failed, stopping tree upload of {}", sourceDir.string());
      break;
    }
  }

  spdlog::info("{}/{} files uploaded to '{}'", report.succeeded, report.total, container);
  return report;
}

} // namespace safs
