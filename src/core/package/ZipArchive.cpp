#include "ZipArchive.hpp"

#include <spdlog/spdlog.h>
#include <zip.h>

#include <algorithm>
#include <system_error>

#include "core/errors/Errors.hpp"

namespace safs {

namespace fs = std::filesystem;

namespace {

std::string zip_error_text(int code) {
  zip_error_t err;
  zip_error_init_with_code(&err, code);
  std::string text = zip_error_strerror(&err);
  zip_error_fini(&err);
  return text;
}

} // namespace

size_t zip_directory(const fs::path& dir, const fs::path& zipPath) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) throw FilesystemError("not a directory: " + dir.string());

  std::vector<fs::path> files;
  for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec)) files.push_back(it->path());
  }
  if (ec) throw FilesystemError("cannot list " + dir.string() + ": " + ec.message());
  std::sort(files.begin(), files.end());

  int code = 0;
  zip_t* archive = zip_open(zipPath.string().c_str(), ZIP_CREATE | ZIP_TRUNCATE, &code);
  if (!archive) throw FilesystemError("cannot create " + zipPath.string() + ": " + zip_error_text(code));

  const fs::path base = dir.parent_path();
  for (const auto& file : files) {
    const std::string name = file.lexically_relative(base).generic_string();
    zip_source_t* src = zip_source_file(archive, file.string().c_str(), 0, 0);
    if (!src) {
      const std::string why = zip_strerror(archive);
      zip_discard(archive);
      throw FilesystemError("cannot read " + file.string() + ": " + why);
    }
    const zip_int64_t idx = zip_file_add(archive, name.c_str(), src, ZIP_FL_ENC_UTF_8 | ZIP_FL_OVERWRITE);
    if (idx < 0) {
      const std::string why = zip_strerror(archive);
      zip_source_free(src);
      zip_discard(archive);
      throw FilesystemError("cannot add " + name + " to " + zipPath.string() + ": " + why);
    }
    zip_set_file_compression(archive, static_cast<zip_uint64_t>(idx), ZIP_CM_DEFLATE, 0);
  }

  if (zip_close(archive) != 0) {
    const std::string why = zip_strerror(archive);
    zip_discard(archive);
    throw FilesystemError("cannot write " + zipPath.string() + ": " + why);
  }
  spdlog::info("zip {}: {} file(s)", zipPath.string(), files.size());
  return files.size();
}

std::vector<std::string> zip_entry_names(const fs::path& zipPath) {
  int code = 0;
  zip_t* archive = zip_open(zipPath.string().c_str(), ZIP_RDONLY, &code);
  if (!archive) throw FilesystemError("cannot open " + zipPath.string() + ": " + zip_error_text(code));
  std::vector<std::string> names;
  const zip_int64_t total = zip_get_num_entries(archive, 0);
  for (zip_int64_t i = 0; i < total; ++i) {
    const char* name = zip_get_name(archive, static_cast<zip_uint64_t>(i), 0);
    if (name) names.emplace_back(name);
  }
  zip_close(archive);
  return names;
}

} // namespace safs
