// Internal header for the segment worker pool
#include "../src/thread_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <numeric>
#include <stdexcept>
#include <vector>

using docdelta_cpp::detail::ThreadPool;

TEST(ThreadPool, visits_every_index_once) {
    auto pool = ThreadPool{4};
    auto hits = std::vector<std::atomic<int>>(100);
    pool.parallel_for(hits.size(), [&](std::size_t i) { hits[i].fetch_add(1); });

    for (const auto& hit : hits) EXPECT_EQ(hit.load(), 1);
}

TEST(ThreadPool, fewer_items_than_workers) {
    auto pool = ThreadPool{8};
    auto results = std::vector<int>(3, 0);
    pool.parallel_for(results.size(), [&](std::size_t i) { results[i] = static_cast<int>(i) * 2; });
    EXPECT_EQ(results, (std::vector<int>{0, 2, 4}));
}

TEST(ThreadPool, zero_items_is_a_no_op) {
    auto pool = ThreadPool{2};
    auto calls = std::atomic<int>{0};
    pool.parallel_for(0, [&](std::size_t) { calls.fetch_add(1); });
    EXPECT_EQ(calls.load(), 0);
    EXPECT_EQ(pool.size(), 2u);
}

TEST(ThreadPool, reusable_across_calls) {
    auto pool = ThreadPool{3};
    auto sum = std::atomic<long>{0};
    for (int round = 0; round < 5; ++round) {
        pool.parallel_for(10, [&](std::size_t i) { sum.fetch_add(static_cast<long>(i)); });
    }
    EXPECT_EQ(sum.load(), 5 * 45);
}

TEST(ThreadPool, rethrows_worker_exception_after_all_chunks) {
    auto pool = ThreadPool{4};
    auto completed = std::atomic<int>{0};
    EXPECT_THROW(pool.parallel_for(8, [&](std::size_t i) {
                     if (i == 5) throw std::runtime_error{"boom"};
                     completed.fetch_add(1);
                 }),
                 std::runtime_error);
    // chunk {4, 5} stops at 5; every other chunk runs to completion
    EXPECT_EQ(completed.load(), 7);

    auto after = std::atomic<int>{0};
    pool.parallel_for(4, [&](std::size_t) { after.fetch_add(1); });
    EXPECT_EQ(after.load(), 4);
}

TEST(ThreadPool, idle_workers_stop_on_destruction) {
    for (int round = 0; round < 20; ++round) {
        auto pool = ThreadPool{3};
        if (round % 2 == 0) pool.parallel_for(2, [](std::size_t) {});
    }
    SUCCEED();
}
