#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace safs {

struct ScanOptions {
  std::vector<std::string> metadataExtensions {".csv"};
  std::vector<std::string> documentExtensions {".pdf"};
  bool recursive = true;
  bool skipHidden = true;
  // Directory names never descended into (generated package output).
  std::vector<std::string> skipDirNames {"SimpleArchiveFormat"};
};

// One directory holding at least one metadata file.
struct ScanEntry {
  std::filesystem::path directory;
  std::filesystem::path relativePath;   // from the scan root; "." for the root
  std::vector<std::filesystem::path> metadataFiles;  // sorted
  std::vector<std::filesystem::path> documentFiles;  // sorted
};

// A directory the scan could not read. Reported, never fatal.
struct ScanError {
  std::filesystem::path directory;
  std::string reason;
  bool accessDenied = false;
};

// Case-insensitive extension test against a list like {".pdf"}.
bool has_extension(const std::filesystem::path& p, const std::vector<std::string>& exts);

// Lists the regular files of one directory that match exts, sorted by name.
// Throws std::filesystem::filesystem_error when the directory is unreadable.
std::vector<std::filesystem::path> list_files(const std::filesystem::path& dir,
                                              const std::vector<std::string>& exts);

// Lazy depth-first walk. Each next() reads only as many directories as it
// needs to find the next candidate; order is sorted and therefore stable.
class DirectoryScanner {
public:
  DirectoryScanner(std::filesystem::path root, ScanOptions opts = {});

  std::optional<ScanEntry> next();

  const std::vector<ScanError>& errors() const { return errors_; }

private:
  bool wantsSubdir(const std::filesystem::directory_entry& de) const;

  std::filesystem::path root_;
  ScanOptions opts_;
  std::vector<std::filesystem::path> stack_;
  std::vector<ScanError> errors_;
};

// Drains a scanner. Errors are appended to *errors when given.
std::vector<ScanEntry> scan_all(const std::filesystem::path& root,
                                const ScanOptions& opts = {},
                                std::vector<ScanError>* errors = nullptr);

} // namespace safs
