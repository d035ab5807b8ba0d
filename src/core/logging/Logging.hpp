#pragma once
#include <string>

namespace safs {

// Installs the default spdlog logger: colored stdout, plus a rotating file
// sink when logFile is non-empty. level is an spdlog level name ("info", ...).
void initLogging(const std::string& level, const std::string& logFile);

} // namespace safs
