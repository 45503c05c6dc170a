#include "common/Logger.hpp"

#include "common/Errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>

namespace ddns::common {

namespace {

constexpr const char* kLoggerName = "ddns";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

}  // namespace

bool Logger::_bInitialized = false;

spdlog::level::level_enum Logger::parseLevel(const std::string& sLevel) {
  std::string sLower = sLevel;
  std::transform(sLower.begin(), sLower.end(), sLower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  // spdlog maps unknown names to "off", which would silently mute the daemon.
  auto level = spdlog::level::from_str(sLower);
  if (level == spdlog::level::off && sLower != "off") {
    throw ValidationError("invalid_log_level", "Unknown log level '" + sLevel + "'");
  }
  return level;
}

void Logger::init(const std::string& sLevel) {
  const auto level = parseLevel(sLevel);

  if (_bInitialized) {
    spdlog::default_logger()->set_level(level);
    return;
  }

  auto spLogger = spdlog::stdout_color_mt(kLoggerName);
  spLogger->set_pattern(kPattern);
  spLogger->set_level(level);
  spdlog::set_default_logger(spLogger);
  _bInitialized = true;
}

std::shared_ptr<spdlog::logger> Logger::get() {
  if (!_bInitialized) {
    init("info");
  }
  return spdlog::default_logger();
}

}  // namespace ddns::common
