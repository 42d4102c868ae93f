/**
 * @file test_task_pool.cpp
 * @brief Unit tests for the worker pool used by phase execution.
 */

#include <catch2/catch_test_macros.hpp>

#include <modbridge/core/task_pool.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace modbridge::core;

TEST_CASE("TaskPool without workers runs tasks inline", "[core][tasks]") {
    TaskPool pool(0);
    REQUIRE(pool.worker_count() == 0);

    const auto caller = std::this_thread::get_id();
    std::thread::id ranOn;
    pool.dispatch([&] { ranOn = std::this_thread::get_id(); });

    REQUIRE(ranOn == caller);
    pool.wait_for_all();
}

TEST_CASE("TaskPool runs every dispatched task before wait_for_all returns", "[core][tasks]") {
    TaskPool pool(4);
    REQUIRE(pool.worker_count() == 4);

    std::atomic<int> counter{0};
    for (int i = 0; i < 200; ++i) {
        pool.dispatch([&] { counter.fetch_add(1); });
    }
    pool.wait_for_all();

    REQUIRE(counter.load() == 200);

    SECTION("pool is reusable") {
        pool.dispatch([&] { counter.fetch_add(1); });
        pool.wait_for_all();
        REQUIRE(counter.load() == 201);
    }
}

TEST_CASE("TaskPool survives a throwing task", "[core][tasks]") {
    TaskPool pool(2);
    std::atomic<int> counter{0};

    pool.dispatch([] { throw std::runtime_error("task failure"); });
    pool.dispatch([&] { counter.fetch_add(1); });
    pool.wait_for_all();

    REQUIRE(counter.load() == 1);
}
