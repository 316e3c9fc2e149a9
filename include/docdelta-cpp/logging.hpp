/// @file logging.hpp
/// @brief Logging setup for docdelta-cpp.
///
/// The library logs through zlog under the category "docdelta". Logging is
/// off until init_logging() succeeds; the library never initialises zlog on
/// its own.

#pragma once

namespace docdelta_cpp {

/// Category name used for every library log record.
inline constexpr const char* log_category_name = "docdelta";

/// Initialise zlog from @p config_path and attach the library category.
///
/// A null path lets zlog fall back to the ZLOG_CONF_PATH environment
/// variable. Returns false if zlog rejects the configuration or the
/// configuration has no rule for the "docdelta" category.
auto init_logging(const char* config_path = nullptr) -> bool;

/// Detach the category and release zlog. Safe to call when not initialised.
void shutdown_logging();

/// True between a successful init_logging() and shutdown_logging().
auto logging_enabled() noexcept -> bool;

}  // namespace docdelta_cpp
