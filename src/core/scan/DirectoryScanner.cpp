#include "DirectoryScanner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <functional>
#include <system_error>

namespace safs {

namespace fs = std::filesystem;

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool has_extension(const fs::path& p, const std::vector<std::string>& exts) {
  const std::string ext = lower(p.extension().string());
  for (const auto& e : exts) {
    if (ext == lower(e)) return true;
  }
  return false;
}

std::vector<fs::path> list_files(const fs::path& dir, const std::vector<std::string>& exts) {
  std::vector<fs::path> out;
  for (const auto& de : fs::directory_iterator(dir)) {
    std::error_code ec;
    if (!de.is_regular_file(ec) || ec) continue;
    if (has_extension(de.path(), exts)) out.push_back(de.path());
  }
  std::sort(out.begin(), out.end(),
            [](const fs::path& a, const fs::path& b) { return a.filename() < b.filename(); });
  return out;
}

DirectoryScanner::DirectoryScanner(fs::path root, ScanOptions opts)
  : root_(std::move(root)), opts_(std::move(opts)) {
  stack_.push_back(root_);
}

bool DirectoryScanner::wantsSubdir(const fs::directory_entry& de) const {
  if (!opts_.recursive) return false;
  const std::string name = de.path().filename().string();
  if (opts_.skipHidden && !name.empty() && name[0] == '.') return false;
  if (std::find(opts_.skipDirNames.begin(), opts_.skipDirNames.end(), name) != opts_.skipDirNames.end()) return false;
  std::error_code ec;
  return !de.is_symlink(ec); // avoid cycles
}

std::optional<ScanEntry> DirectoryScanner::next() {
  while (!stack_.empty()) {
    fs::path dir = std::move(stack_.back());
    stack_.pop_back();

    std::vector<fs::path> subdirs;
    std::vector<fs::path> metadata;
    std::vector<fs::path> documents;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
      const bool denied = ec == std::errc::permission_denied;
      spdlog::warn("scan: cannot read {}: {}", dir.string(), ec.message());
      errors_.push_back({dir, ec.message(), denied});
      continue;
    }

    for (fs::directory_iterator end; it != end;) {
      const auto& de = *it;
      std::error_code sec;
      if (de.is_directory(sec) && !sec) {
        if (wantsSubdir(de)) subdirs.push_back(de.path());
      } else if (de.is_regular_file(sec) && !sec) {
        if (has_extension(de.path(), opts_.metadataExtensions)) metadata.push_back(de.path());
        else if (has_extension(de.path(), opts_.documentExtensions)) documents.push_back(de.path());
      }
      it.increment(ec);
      if (ec) {
        spdlog::warn("scan: iteration failed in {}: {}", dir.string(), ec.message());
        errors_.push_back({dir, ec.message(), ec == std::errc::permission_denied});
        break;
      }
    }

    // Reverse order on the stack so children pop in ascending name order.
    std::sort(subdirs.begin(), subdirs.end(), std::greater<fs::path>());
    for (auto& s : subdirs) stack_.push_back(std::move(s));

    if (metadata.empty()) continue;

    auto byName = [](const fs::path& a, const fs::path& b) { return a.filename() < b.filename(); };
    std::sort(metadata.begin(), metadata.end(), byName);
    std::sort(documents.begin(), documents.end(), byName);

    ScanEntry entry;
    entry.directory = dir;
    entry.relativePath = dir.lexically_relative(root_);
    if (entry.relativePath.empty()) entry.relativePath = ".";
    entry.metadataFiles = std::move(metadata);
    entry.documentFiles = std::move(documents);
    return entry;
  }
  return std::nullopt;
}

std::vector<ScanEntry> scan_all(const fs::path& root, const ScanOptions& opts, std::vector<ScanError>* errors) {
  DirectoryScanner scanner(root, opts);
  std::vector<ScanEntry> out;
  while (auto e = scanner.next()) out.push_back(std::move(*e));
  if (errors) errors->insert(errors->end(), scanner.errors().begin(), scanner.errors().end());
  spdlog::debug("scan: {} candidate directories under {}", out.size(), root.string());
  return out;
}

} // namespace safs
