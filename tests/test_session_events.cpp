#include <doctest/doctest.h>
#include "core/ThreadPool.hpp"
#include "core/xdcc/SessionEvents.hpp"

#include <atomic>
#include <future>
#include <thread>

using namespace botarr::core;
using namespace botarr::core::xdcc;
using namespace std::chrono_literals;

TEST_CASE("EventQueue delivers events in order") {
    EventQueue queue;
    CHECK(queue.push(events::Connecting{}));
    CHECK(queue.push(events::Joining{"#chan"}));
    CHECK(queue.push(events::Progress{10, 100, 5.0}));

    auto first = queue.pop(10ms);
    REQUIRE(first);
    CHECK(std::holds_alternative<events::Connecting>(*first));

    auto second = queue.pop(10ms);
    REQUIRE(second);
    REQUIRE(std::holds_alternative<events::Joining>(*second));
    CHECK(std::get<events::Joining>(*second).channel == "#chan");

    auto third = queue.pop(10ms);
    REQUIRE(third);
    CHECK(std::get<events::Progress>(*third).downloaded == 10);

    CHECK_FALSE(queue.pop(10ms).has_value());
}

TEST_CASE("EventQueue close lets the consumer drain") {
    EventQueue queue;
    queue.push(events::Completed{});
    queue.close();

    CHECK(queue.isClosed());
    CHECK_FALSE(queue.isFinished());
    CHECK_FALSE(queue.push(events::Connecting{}));

    auto event = queue.pop(10ms);
    REQUIRE(event);
    CHECK(std::holds_alternative<events::Completed>(*event));
    CHECK(queue.isFinished());
    CHECK_FALSE(queue.pop(1s).has_value());
}

TEST_CASE("EventQueue push blocks while full") {
    EventQueue queue(2);
    queue.push(events::Connecting{});
    queue.push(events::Connected{});

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        queue.push(events::Completed{});
        pushed = true;
    });

    std::this_thread::sleep_for(100ms);
    CHECK_FALSE(pushed.load());

    REQUIRE(queue.pop(10ms));
    producer.join();
    CHECK(pushed.load());

    REQUIRE(queue.pop(10ms));
    auto last = queue.pop(10ms);
    REQUIRE(last);
    CHECK(std::holds_alternative<events::Completed>(*last));
}

TEST_CASE("EventQueue close releases a blocked producer") {
    EventQueue queue(1);
    queue.push(events::Connecting{});

    std::promise<bool> result;
    std::thread producer([&] { result.set_value(queue.push(events::Completed{})); });

    std::this_thread::sleep_for(50ms);
    queue.close();
    producer.join();
    CHECK_FALSE(result.get_future().get());
}

TEST_CASE("CancellationHandle wakes waiters") {
    auto handle = std::make_shared<CancellationHandle>();
    CHECK_FALSE(handle->isCancelled());
    CHECK_FALSE(handle->waitFor(10ms));

    std::thread canceller([handle] {
        std::this_thread::sleep_for(50ms);
        handle->cancel();
    });

    auto started = std::chrono::steady_clock::now();
    CHECK(handle->waitFor(10s));
    CHECK(std::chrono::steady_clock::now() - started < 5s);
    canceller.join();

    CHECK(handle->isCancelled());
    CHECK(handle->waitFor(0ms));
}

TEST_CASE("ThreadPool runs higher priority tasks first") {
    ThreadPool pool(1);

    std::promise<void> gate;
    auto released = gate.get_future().share();
    pool.submit([released] { released.wait(); });
    while (pool.activeJobs() == 0) {
        std::this_thread::sleep_for(1ms);
    }

    std::mutex mutex;
    std::vector<int> order;
    auto record = [&](int value) {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(value);
    };

    pool.submitPriority(0, record, 1);
    pool.submitPriority(3, record, 2);
    pool.submitPriority(1, record, 3);
    pool.submitPriority(3, record, 4);

    CHECK(pool.pendingTasks() == 4);
    gate.set_value();
    pool.waitAll();

    std::vector<int> expected{2, 4, 3, 1};
    CHECK(order == expected);
    CHECK(pool.activeJobs() == 0);
}

TEST_CASE("ThreadPool futures carry results and exceptions") {
    ThreadPool pool(2);
    CHECK(pool.size() == 2);

    auto sum = pool.submit([](int a, int b) { return a + b; }, 2, 3);
    CHECK(sum.get() == 5);

    auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    CHECK_THROWS_AS(failing.get(), std::runtime_error);
}
