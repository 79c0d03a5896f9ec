// SPDX-License-Identifier: Apache-2.0
#include <pipeline/FrameQueue.hpp>
#include <pipeline/RateMeter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <stop_token>
#include <thread>

using namespace framecast;
using namespace std::chrono_literals;

TEST_CASE("FrameQueue delivers items in FIFO order", "[queue]")
{
    auto queue = FrameQueue<int>(4);
    auto const token = std::stop_token {};

    for (auto i = 0; i < 4; ++i)
        REQUIRE(queue.push(i, token));
    CHECK(queue.size() == 4);

    for (auto i = 0; i < 4; ++i)
        CHECK(queue.pop(token) == i);
}

TEST_CASE("FrameQueue blocks the producer while full", "[queue]")
{
    auto queue = FrameQueue<int>(2);
    auto const token = std::stop_token {};
    REQUIRE(queue.push(1, token));
    REQUIRE(queue.push(2, token));

    auto pushed = std::atomic<bool> { false };
    auto producer = std::jthread([&] {
        auto const ok = queue.push(3, token);
        pushed = ok;
    });

    std::this_thread::sleep_for(50ms);
    CHECK(!pushed);
    CHECK(queue.size() == 2);

    CHECK(queue.pop(token) == 1);
    producer.join();
    CHECK(pushed);
    CHECK(queue.size() == 2);
    CHECK(queue.pop(token) == 2);
    CHECK(queue.pop(token) == 3);
}

TEST_CASE("FrameQueue never holds more than its capacity", "[queue]")
{
    constexpr auto Capacity = std::size_t { 3 };
    constexpr auto Items = 200;

    auto queue = FrameQueue<int>(Capacity);
    auto const token = std::stop_token {};
    auto maxSize = std::atomic<std::size_t> { 0 };

    auto producer = std::jthread([&] {
        for (auto i = 0; i < Items; ++i)
        {
            if (!queue.push(i, token))
                break;
            auto const size = queue.size();
            if (size > maxSize)
                maxSize = size;
        }
        queue.close();
    });

    auto received = 0;
    while (auto item = queue.pop(token))
    {
        CHECK(*item == received);
        ++received;
        if (received % 16 == 0)
            std::this_thread::sleep_for(1ms);
    }

    producer.join();
    CHECK(received == Items);
    CHECK(maxSize <= Capacity);
}

TEST_CASE("FrameQueue close is terminal and drains remaining items", "[queue]")
{
    auto queue = FrameQueue<int>(4);
    auto const token = std::stop_token {};
    REQUIRE(queue.push(7, token));
    queue.close();

    CHECK(queue.closed());
    CHECK(!queue.finished());
    CHECK(!queue.push(8, token));
    CHECK(queue.pop(token) == 7);
    CHECK(!queue.pop(token).has_value());
    CHECK(queue.finished());
}

TEST_CASE("FrameQueue waits wake up on a stop request", "[queue]")
{
    auto queue = FrameQueue<int>(1);
    auto stopSource = std::stop_source {};
    auto const token = stopSource.get_token();

    SECTION("blocked pop")
    {
        auto result = std::atomic<bool> { true };
        auto consumer = std::jthread([&] { result = queue.pop(token).has_value(); });
        std::this_thread::sleep_for(20ms);
        stopSource.request_stop();
        consumer.join();
        CHECK(!result);
        CHECK(!queue.finished());
    }

    SECTION("blocked push")
    {
        REQUIRE(queue.push(1, token));
        auto result = std::atomic<bool> { true };
        auto producer = std::jthread([&] { result = queue.push(2, token); });
        std::this_thread::sleep_for(20ms);
        stopSource.request_stop();
        producer.join();
        CHECK(!result);
        CHECK(queue.size() == 1);
    }
}

TEST_CASE("RateMeter reports only after the first second, once per interval", "[queue][rate]")
{
    auto meter = RateMeter(1000ms);
    auto const t0 = RateMeter::Clock::time_point {} + 1h;
    meter.start(t0);

    CHECK(!meter.recordFrame(t0 + 100ms).has_value());
    CHECK(!meter.recordFrame(t0 + 1000ms).has_value());

    auto const first = meter.recordFrame(t0 + 1500ms);
    REQUIRE(first.has_value());
    CHECK(first->frames == 3);
    CHECK(first->elapsedSeconds == 1.5);
    CHECK(first->fps == 2.0);

    CHECK(!meter.recordFrame(t0 + 2000ms).has_value());
    auto const second = meter.recordFrame(t0 + 2500ms);
    REQUIRE(second.has_value());
    CHECK(second->frames == 5);
    CHECK(second->fps == 2.0);
    CHECK(meter.frames() == 5);
}
