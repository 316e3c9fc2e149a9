#include <docdelta-cpp/logging.hpp>

#include "log.hpp"

#include <atomic>
#include <mutex>

namespace docdelta_cpp {

namespace {

std::atomic<zlog_category_t*> g_category{nullptr};
std::mutex g_init_mutex;

}  // namespace

auto detail::log_category() noexcept -> zlog_category_t* {
    return g_category.load(std::memory_order_acquire);
}

auto init_logging(const char* config_path) -> bool {
    auto lock = std::scoped_lock{g_init_mutex};
    if (g_category.load(std::memory_order_relaxed) != nullptr) return true;

    if (zlog_init(config_path) != 0) return false;
    auto* category = zlog_get_category(log_category_name);
    if (category == nullptr) {
        zlog_fini();
        return false;
    }
    g_category.store(category, std::memory_order_release);
    DOCDELTA_LOG_INFO("logging initialised");
    return true;
}

void shutdown_logging() {
    auto lock = std::scoped_lock{g_init_mutex};
    if (g_category.exchange(nullptr, std::memory_order_acq_rel) != nullptr) {
        zlog_fini();
    }
}

auto logging_enabled() noexcept -> bool {
    return g_category.load(std::memory_order_acquire) != nullptr;
}

}  // namespace docdelta_cpp
