#pragma once
#include <string>

namespace safs {

// Creates the database file (and its parent directory) if needed, sets the
// WAL/foreign-key pragmas and applies schemaPath. Idempotent. Throws StorageError.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace safs
