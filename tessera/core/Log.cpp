#include "Log.h"

#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Tessera::Log {
void Init(const std::string &logDir) {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::create_directories(logDir, ec);

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!ec) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        (fs::path(logDir) / "tessera.log").string(), true));
  }

  auto logger =
      std::make_shared<spdlog::logger>("tessera", sinks.begin(), sinks.end());
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%T] [%^%l%$] %v");
  spdlog::set_level(spdlog::level::debug);
  spdlog::flush_on(spdlog::level::info);

  if (ec)
    Warn("Log directory '{}' unavailable ({}), logging to stdout only", logDir,
         ec.message());
}
} // namespace Tessera::Log
