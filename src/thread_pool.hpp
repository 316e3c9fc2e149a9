#pragma once

// Internal header — not installed.
// Fixed set of std::jthread workers with a blocking parallel_for. Used to
// diff the segments of a document concurrently.

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <latch>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

namespace docdelta_cpp::detail {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int num_threads)
        : num_threads_{num_threads} {
        workers_.reserve(num_threads);
        for (unsigned int i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this](std::stop_token st) { worker_loop(st); });
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    auto operator=(const ThreadPool&) -> ThreadPool& = delete;

    /// Call fn(i) for every i in [0, count), split into one chunk per
    /// worker, and block until all chunks finish. A throwing call ends its
    /// chunk; the exception of the lowest failing chunk is rethrown.
    template <typename Fn>
    void parallel_for(std::size_t count, Fn&& fn) {
        if (count == 0) return;

        const auto chunks = std::min(static_cast<std::size_t>(num_threads_), count);
        auto done = std::latch{static_cast<std::ptrdiff_t>(chunks)};
        auto errors = std::vector<std::exception_ptr>(chunks);
        {
            auto lock = std::scoped_lock{mutex_};
            for (std::size_t c = 0; c < chunks; ++c) {
                tasks_.emplace_back([&fn, &done, &errors, c, begin = c * count / chunks,
                                     end = (c + 1) * count / chunks] {
                    try {
                        for (auto i = begin; i < end; ++i) fn(i);
                    } catch (...) {
                        errors[c] = std::current_exception();
                    }
                    done.count_down();
                });
            }
        }
        cv_.notify_all();

        done.wait();
        for (const auto& error : errors) {
            if (error) std::rethrow_exception(error);
        }
    }

    auto size() const -> unsigned int { return num_threads_; }

private:
    void worker_loop(std::stop_token st) {
        auto lock = std::unique_lock{mutex_};
        while (cv_.wait(lock, st, [this] { return !tasks_.empty(); })) {
            auto task = std::move(tasks_.front());
            tasks_.pop_front();
            lock.unlock();
            task();
            lock.lock();
        }
    }

    unsigned int num_threads_;
    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<std::function<void()>> tasks_;
    std::vector<std::jthread> workers_;  // declared last: joined first
};

}  // namespace docdelta_cpp::detail
