// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/threadpool.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <vector>

using blockdag::util::ThreadPool;

TEST_CASE("ThreadPool runs tasks and returns results", "[util][threadpool]") {
    ThreadPool pool(4, "test");
    REQUIRE(pool.size() == 4);
    REQUIRE(pool.name() == "test");

    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.enqueue([i]() { return i * i; }));
    }
    for (int i = 0; i < 20; ++i) {
        REQUIRE(results[i].get() == i * i);
    }

    auto with_args = pool.enqueue([](int a, int b) { return a + b; }, 2, 3);
    REQUIRE(with_args.get() == 5);
}

TEST_CASE("ThreadPool with zero threads uses hardware concurrency", "[util][threadpool]") {
    ThreadPool pool(0);
    REQUIRE(pool.size() > 0);
}

TEST_CASE("Single-thread pool is a serial executor", "[util][threadpool]") {
    ThreadPool pool(1, "serial");
    std::mutex mutex;
    std::vector<int> order;
    std::atomic<int> running{0};
    std::atomic<bool> overlapped{false};

    for (int i = 0; i < 50; ++i) {
        pool.enqueue([&, i]() {
            if (running.fetch_add(1) != 0) {
                overlapped = true;
            }
            {
                std::lock_guard<std::mutex> lock(mutex);
                order.push_back(i);
            }
            running.fetch_sub(1);
        });
    }
    pool.wait_idle();

    REQUIRE_FALSE(overlapped);
    REQUIRE(order.size() == 50);
    for (int i = 0; i < 50; ++i) {
        REQUIRE(order[i] == i);
    }
}

TEST_CASE("ThreadPool delivers task exceptions through the future", "[util][threadpool]") {
    ThreadPool pool(2, "throwing");
    auto failing = pool.enqueue([]() -> int { throw std::runtime_error("task failed"); });
    REQUIRE_THROWS_AS(failing.get(), std::runtime_error);

    // Worker survives
    auto next = pool.enqueue([]() { return 7; });
    REQUIRE(next.get() == 7);
}

TEST_CASE("ThreadPool shutdown", "[util][threadpool]") {
    ThreadPool pool(2, "closing");
    std::atomic<int> ran{0};
    for (int i = 0; i < 10; ++i) {
        pool.enqueue([&ran]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            ++ran;
        });
    }

    pool.shutdown();
    REQUIRE(pool.is_stopped());
    REQUIRE_THROWS_AS(pool.enqueue([]() {}), std::runtime_error);

    // Queued work still drains
    pool.wait_for_completion();
    REQUIRE(ran == 10);
    REQUIRE(pool.tasks_completed() == 10);

    // Repeated shutdown is harmless
    pool.shutdown();
}

TEST_CASE("ThreadPool bounded queue", "[util][threadpool]") {
    ThreadPool pool(1, "bounded", 1);
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::promise<void> started;

    auto blocker = pool.enqueue([opened, &started]() {
        started.set_value();
        opened.wait();
    });
    started.get_future().wait();

    auto queued = pool.enqueue([]() {});
    REQUIRE(pool.pending_tasks() == 1);
    REQUIRE_THROWS_AS(pool.enqueue([]() {}), std::runtime_error);

    gate.set_value();
    blocker.get();
    queued.get();
    pool.wait_idle();
    REQUIRE(pool.pending_tasks() == 0);
}
