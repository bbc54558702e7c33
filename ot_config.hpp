// ot_config.hpp
#ifndef OT_CONFIG_HPP
#define OT_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

// Compile-time defaults. Override with -DOT_DEFAULT_HISTORY_LIMIT=... etc.
#ifndef OT_DEFAULT_HISTORY_LIMIT
#define OT_DEFAULT_HISTORY_LIMIT 256
#endif

#ifndef OT_DEFAULT_DEDUP_LIMIT
#define OT_DEFAULT_DEDUP_LIMIT 1024
#endif

#ifndef OT_DEFAULT_SNAPSHOT_INTERVAL
#define OT_DEFAULT_SNAPSHOT_INTERVAL 0
#endif

#ifndef OT_MAX_HISTORY_LIMIT
#define OT_MAX_HISTORY_LIMIT 100000
#endif

/// Tunables shared by every document of a registry
struct CoordinatorConfig {
  /// Number of applied operations kept for rebasing. A client more than this
  /// many versions behind receives StaleClient.
  size_t history_limit = OT_DEFAULT_HISTORY_LIMIT;

  /// Number of operation ids remembered for duplicate detection. Never smaller
  /// than history_limit.
  size_t dedup_limit = OT_DEFAULT_DEDUP_LIMIT;

  /// Create a document on its first submit instead of failing with UnknownDocument
  bool implicit_create = true;

  /// Emit a snapshot to the snapshot sink every N applied operations (0 = never)
  uint64_t snapshot_interval = OT_DEFAULT_SNAPSHOT_INTERVAL;

  /// @throws std::invalid_argument if a value is out of range
  void validate() const {
    if (history_limit == 0 || history_limit > OT_MAX_HISTORY_LIMIT) {
      throw std::invalid_argument("history_limit must be in [1, " + std::to_string(OT_MAX_HISTORY_LIMIT) +
                                  "], got " + std::to_string(history_limit));
    }
    if (dedup_limit < history_limit) {
      throw std::invalid_argument("dedup_limit (" + std::to_string(dedup_limit) +
                                  ") must not be smaller than history_limit (" + std::to_string(history_limit) + ")");
    }
  }

  /// Reads overrides from OTLITE_HISTORY_LIMIT, OTLITE_DEDUP_LIMIT,
  /// OTLITE_IMPLICIT_CREATE and OTLITE_SNAPSHOT_INTERVAL. Unset variables keep
  /// the defaults.
  /// @throws std::invalid_argument on unparsable or out-of-range values
  static CoordinatorConfig from_env() {
    CoordinatorConfig config;
    if (const char *v = std::getenv("OTLITE_HISTORY_LIMIT")) {
      config.history_limit = parse_unsigned("OTLITE_HISTORY_LIMIT", v);
    }
    if (const char *v = std::getenv("OTLITE_DEDUP_LIMIT")) {
      config.dedup_limit = parse_unsigned("OTLITE_DEDUP_LIMIT", v);
    } else if (config.dedup_limit < config.history_limit) {
      config.dedup_limit = config.history_limit;
    }
    if (const char *v = std::getenv("OTLITE_IMPLICIT_CREATE")) {
      config.implicit_create = parse_bool("OTLITE_IMPLICIT_CREATE", v);
    }
    if (const char *v = std::getenv("OTLITE_SNAPSHOT_INTERVAL")) {
      config.snapshot_interval = parse_unsigned("OTLITE_SNAPSHOT_INTERVAL", v);
    }
    config.validate();
    return config;
  }

private:
  static uint64_t parse_unsigned(const char *name, const std::string &value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
      throw std::invalid_argument(std::string(name) + " must be a non-negative integer, got '" + value + "'");
    }
    try {
      return std::stoull(value);
    } catch (const std::out_of_range &) {
      throw std::invalid_argument(std::string(name) + " is out of range: '" + value + "'");
    }
  }

  static bool parse_bool(const char *name, const std::string &value) {
    if (value == "1" || value == "true" || value == "on" || value == "yes")
      return true;
    if (value == "0" || value == "false" || value == "off" || value == "no")
      return false;
    throw std::invalid_argument(std::string(name) + " must be a boolean, got '" + value + "'");
  }
};

#endif // OT_CONFIG_HPP
