#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace safs {

// Writes every regular file under dir into a deflated zip at zipPath,
// replacing any previous archive. Entry names are relative to dir's parent,
// so they start with dir's own name. Returns the number of entries.
// Throws FilesystemError.
size_t zip_directory(const std::filesystem::path& dir, const std::filesystem::path& zipPath);

// Entry names of an existing archive, in archive order.
std::vector<std::string> zip_entry_names(const std::filesystem::path& zipPath);

} // namespace safs
