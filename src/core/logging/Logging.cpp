#include "Logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <memory>
#include <vector>

namespace safs {

void initLogging(const std::string& level, const std::string& logFile) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  if (!logFile.empty()) {
    auto parent = std::filesystem::path(logFile).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);
    // 10 MB x 3 files
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFile, 10 * 1024 * 1024, 3);
    file_sink->set_level(spdlog::level::trace);
    sinks.push_back(file_sink);
  }

  auto logger = std::make_shared<spdlog::logger>("safs", sinks.begin(), sinks.end());
  logger->set_level(spdlog::level::from_str(level));
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
}

} // namespace safs
