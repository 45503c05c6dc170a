#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace ddns::common {

/// Process-wide "ddns" logger on colored stdout, installed as spdlog's
/// default logger so background threads and tests share one sink.
/// Class abbreviation: N/A (static interface)
class Logger {
 public:
  /// Install the logger, or only change its level on later calls.
  /// Throws ValidationError("invalid_log_level") for an unknown level name.
  static void init(const std::string& sLevel);

  /// Case-insensitive level name: trace, debug, info, warn (warning),
  /// error (err), critical, off.
  static spdlog::level::level_enum parseLevel(const std::string& sLevel);

  /// Falls back to init("info") when nothing was installed yet.
  static std::shared_ptr<spdlog::logger> get();

 private:
  static bool _bInitialized;
};

}  // namespace ddns::common
