#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace safs {

std::string to_hex(const uint8_t* data, size_t len);

// Hex digests over an in-memory buffer (OpenSSL EVP).
std::string md5_hex(std::string_view bytes);
std::string sha256_hex(std::string_view bytes);

// Streams the file in fixed blocks; throws FilesystemError if unreadable.
std::string sha256_file_hex(const std::filesystem::path& file);

// Random RFC 4122 version 4 identifier.
std::string uuid4();

} // namespace safs
