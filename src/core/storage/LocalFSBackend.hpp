#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace safs {

// Writes package directories under one output root. Every package is built
// in a hidden staging directory and renamed into place, so a package
// directory either exists complete or not at all.
class LocalFSBackend {
public:
  explicit LocalFSBackend(std::filesystem::path outputRoot)
    : root_(std::move(outputRoot)) {}

  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path packageDir(const std::string& id) const { return root_ / id; }
  bool exists(const std::string& id) const;

  // Creates the output root if needed and removes staging directories left
  // behind by an interrupted run. Returns how many were removed.
  size_t prepare();

  // Fresh, empty staging directory for id.
  std::filesystem::path beginStaging(const std::string& id);

  // Writes bytes into dir/name; returns the full path.
  std::filesystem::path put(const std::filesystem::path& dir,
                            const std::string& name,
                            std::string_view bytes);

  // Copies (never moves) source to dir/name.
  std::filesystem::path copyIn(const std::filesystem::path& dir,
                               const std::filesystem::path& source,
                               const std::string& name);

  // Renames the staging directory to root/id.
  std::filesystem::path commit(const std::filesystem::path& staging, const std::string& id);

  // Best effort removal of a staging directory after a failure.
  void discard(const std::filesystem::path& staging) noexcept;

  static bool isStagingName(const std::string& name);

private:
  std::filesystem::path stagingDir(const std::string& id) const;

  std::filesystem::path root_;
};

} // namespace safs
