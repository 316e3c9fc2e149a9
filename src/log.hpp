#pragma once

// Internal header — not installed.
// printf-style logging macros over the zlog "docdelta" category.

#include <zlog.h>

namespace docdelta_cpp::detail {

/// The attached category, or nullptr while logging is off.
auto log_category() noexcept -> zlog_category_t*;

}  // namespace docdelta_cpp::detail

#define DOCDELTA_LOG_(level_fn, ...)                                              \
    do {                                                                          \
        if (auto* docdelta_log_cat_ = ::docdelta_cpp::detail::log_category()) {   \
            level_fn(docdelta_log_cat_, __VA_ARGS__);                             \
        }                                                                         \
    } while (0)

#define DOCDELTA_LOG_DEBUG(...) DOCDELTA_LOG_(zlog_debug, __VA_ARGS__)
#define DOCDELTA_LOG_INFO(...)  DOCDELTA_LOG_(zlog_info, __VA_ARGS__)
#define DOCDELTA_LOG_WARN(...)  DOCDELTA_LOG_(zlog_warn, __VA_ARGS__)
#define DOCDELTA_LOG_ERROR(...) DOCDELTA_LOG_(zlog_error, __VA_ARGS__)
