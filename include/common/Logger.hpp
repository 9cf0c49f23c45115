#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace dyndns::common {

/// Process-wide "dyndns" logger, installed as spdlog's default logger.
/// Class abbreviation: N/A (static interface)
class Logger {
 public:
  /// Set up the logger, or only change its level if already set up.
  /// sLevel is a DYNDNS_LOG_LEVEL value ("debug", "info", "warn", ...).
  static void init(const std::string& sLevel);

  /// Initializes at "info" on first use.
  static std::shared_ptr<spdlog::logger> get();

 private:
  static bool _bInitialized;
};

}  // namespace dyndns::common
