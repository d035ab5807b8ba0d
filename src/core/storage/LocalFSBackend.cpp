#include "LocalFSBackend.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>
#include <vector>

#include "core/errors/Errors.hpp"

namespace safs {

namespace fs = std::filesystem;

static const char* kStagingSuffix = ".partial";

bool LocalFSBackend::isStagingName(const std::string& name) {
  const std::string suffix = kStagingSuffix;
  return name.size() > suffix.size() + 1 && name[0] == '.' &&
         name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

fs::path LocalFSBackend::stagingDir(const std::string& id) const {
  return root_ / ("." + id + kStagingSuffix);
}

bool LocalFSBackend::exists(const std::string& id) const {
  std::error_code ec;
  return fs::exists(packageDir(id), ec);
}

size_t LocalFSBackend::prepare() {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) throw FilesystemError("cannot create output directory " + root_.string() + ": " + ec.message());

  std::vector<fs::path> stale;
  for (const auto& de : fs::directory_iterator(root_, ec)) {
    if (isStagingName(de.path().filename().string())) stale.push_back(de.path());
  }
  if (ec) throw FilesystemError("cannot list output directory " + root_.string() + ": " + ec.message());

  for (const auto& p : stale) {
    spdlog::warn("removing incomplete package staging directory {}", p.string());
    fs::remove_all(p, ec);
    if (ec) throw FilesystemError("cannot remove " + p.string() + ": " + ec.message());
  }
  return stale.size();
}

fs::path LocalFSBackend::beginStaging(const std::string& id) {
  const fs::path dir = stagingDir(id);
  std::error_code ec;
  fs::remove_all(dir, ec);
  if (!fs::create_directories(dir, ec) || ec) {
    throw FilesystemError("cannot create staging directory " + dir.string() +
                          (ec ? ": " + ec.message() : ""));
  }
  return dir;
}

fs::path LocalFSBackend::put(const fs::path& dir, const std::string& name, std::string_view bytes) {
  fs::path file = dir / name;
  std::ofstream os(file, std::ios::binary | std::ios::trunc);
  if (!os) throw FilesystemError("cannot open for writing: " + file.string());
  os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  os.flush();
  if (!os) throw FilesystemError("write failed: " + file.string());
  return file;
}

fs::path LocalFSBackend::copyIn(const fs::path& dir, const fs::path& source, const std::string& name) {
  fs::path file = dir / name;
  std::error_code ec;
  fs::copy_file(source, file, fs::copy_options::overwrite_existing, ec);
  if (ec) throw FilesystemError("copy " + source.string() + " -> " + file.string() + " failed: " + ec.message());
  return file;
}

fs::path LocalFSBackend::commit(const fs::path& staging, const std::string& id) {
  const fs::path target = packageDir(id);
  std::error_code ec;
  if (fs::exists(target, ec)) throw PackageAlreadyExistsError(id);
  fs::rename(staging, target, ec);
  if (ec) throw FilesystemError("cannot move " + staging.string() + " into place: " + ec.message());
  return target;
}

void LocalFSBackend::discard(const fs::path& staging) noexcept {
  std::error_code ec;
  fs::remove_all(staging, ec);
  if (ec) spdlog::warn("could not remove staging directory {}: {}", staging.string(), ec.message());
}

} // namespace safs
