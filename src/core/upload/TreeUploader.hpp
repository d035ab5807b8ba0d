#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/upload/UploadPipeline.hpp"
#include "core/util/Cancellation.hpp"

namespace safs {

struct TreeUploadReport {
  std::string sourceDir;
  std::string container;
  size_t total = 0;
  size_t succeeded = 0;
  bool   aborted = false;        // stopped early on an auth failure or cancellation
  std::vector<FileUploadResult> results;

  bool ok() const { return !aborted && succeeded == total; }
};

nlohmann::json to_json(const TreeUploadReport& r);

struct TreeListing {
  std::vector<std::filesystem::path> files;               // sorted
  std::vector<std::filesystem::path> incompletePackages;  // package directories without a complete manifest
};

// Uploads a package tree. Inside a package directory only the files its
// manifest lists are sent, plus manifest and contents; other directories
// contribute every regular file. Object names are paths relative to the
// source directory's parent, so the folder name is kept:
// /data/out/batch1/item_000/contents -> batch1/item_000/contents.
class TreeUploader {
public:
  explicit TreeUploader(UploadPipeline& pipeline, bool skipHidden = true)
    : pipeline_(pipeline), skipHidden_(skipHidden) {}

  TreeUploadReport uploadDirectory(const std::filesystem::path& sourceDir,
                                   const std::string& container,
                                   const CancellationToken& cancel = {});

  // What uploadDirectory would send. Throws FilesystemError.
  TreeListing collect(const std::filesystem::path& sourceDir) const;

  static std::string objectNameFor(const std::filesystem::path& sourceDir,
                                   const std::filesystem::path& file);

private:
  UploadPipeline& pipeline_;
  bool skipHidden_;
};

} // namespace safs
