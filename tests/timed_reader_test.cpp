#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>

#include "timed_reader.hpp"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

using battctl::TimedReader;
using namespace std::chrono_literals;

namespace {

// Read source whose calls block until the test opens the gate.
struct Gate {
    std::mutex mutex;
    std::condition_variable opened;
    bool open{true};
    std::optional<int> next{0};
    std::atomic<int> calls{0};

    std::optional<int> read()
    {
        ++calls;
        std::unique_lock<std::mutex> lock(mutex);
        opened.wait(lock, [this] { return open; });
        return next;
    }

    void set_open(bool value)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            open = value;
        }
        opened.notify_all();
    }

    void set_next(std::optional<int> value)
    {
        std::lock_guard<std::mutex> lock(mutex);
        next = value;
    }
};

TimedReader<int>::ReadFunction reader_of(const std::shared_ptr<Gate> &gate)
{
    return [gate] { return gate->read(); };
}

void wait_idle(const TimedReader<int> &reader)
{
    for (int i = 0; i < 500 && reader.refresh_in_flight(); ++i) {
        std::this_thread::sleep_for(2ms);
    }
    REQUIRE(!reader.refresh_in_flight());
}

} // namespace

TEST_CASE("a fast read returns the fresh value")
{
    auto gate = std::make_shared<Gate>();
    gate->set_next(300);
    TimedReader<int> reader(reader_of(gate), 1000ms, 0ms);

    CHECK(reader.get() == std::optional<int>(300));
    CHECK(reader.last_known() == std::optional<int>(300));
    CHECK(reader.reads_started() == 1);
}

TEST_CASE("a fresh cached value is served without reading")
{
    auto gate = std::make_shared<Gate>();
    gate->set_next(42);
    TimedReader<int> reader(reader_of(gate), 1000ms, 60000ms);

    CHECK(reader.get() == std::optional<int>(42));
    gate->set_next(43);
    CHECK(reader.get() == std::optional<int>(42));
    CHECK(reader.reads_started() == 1);
    CHECK(gate->calls == 1);
}

TEST_CASE("a stalled read falls back to the last known value")
{
    auto gate = std::make_shared<Gate>();
    gate->set_next(10);
    TimedReader<int> reader(reader_of(gate), 50ms, 0ms);

    REQUIRE(reader.get() == std::optional<int>(10));
    wait_idle(reader);

    gate->set_open(false);
    gate->set_next(11);

    const auto started = std::chrono::steady_clock::now();
    CHECK(reader.get() == std::optional<int>(10));
    CHECK(std::chrono::steady_clock::now() - started < 1000ms);
    CHECK(reader.refresh_in_flight());

    // A second caller while the worker is stuck does not start another one.
    CHECK(reader.get() == std::optional<int>(10));
    CHECK(reader.reads_started() == 2);

    gate->set_open(true);
    wait_idle(reader);
    CHECK(reader.last_known() == std::optional<int>(11));
}

TEST_CASE("a stalled first read yields nothing")
{
    auto gate = std::make_shared<Gate>();
    gate->set_open(false);
    TimedReader<int> reader(reader_of(gate), 20ms, 0ms);

    CHECK(!reader.get().has_value());

    gate->set_open(true);
    wait_idle(reader);
}

TEST_CASE("a failed read keeps the previous value")
{
    auto gate = std::make_shared<Gate>();
    gate->set_next(7);
    TimedReader<int> reader(reader_of(gate), 1000ms, 0ms);

    REQUIRE(reader.get() == std::optional<int>(7));
    gate->set_next(std::nullopt);
    CHECK(reader.get() == std::optional<int>(7));
    CHECK(reader.reads_started() == 2);
}

TEST_CASE("the reader can be destroyed while a read is outstanding")
{
    auto gate = std::make_shared<Gate>();
    gate->set_open(false);
    {
        TimedReader<int> reader(reader_of(gate), 10ms, 0ms);
        CHECK(!reader.get().has_value());
    }
    gate->set_open(true);
    for (int i = 0; i < 500 && gate.use_count() > 1; ++i) {
        std::this_thread::sleep_for(2ms);
    }
    CHECK(gate.use_count() == 1);
}

TEST_CASE("wait_idle blocks until the outstanding read completes")
{
    auto gate = std::make_shared<Gate>();
    gate->set_open(false);
    gate->set_next(5);
    TimedReader<int> reader(reader_of(gate), 10ms, 0ms);

    CHECK(!reader.get().has_value());
    REQUIRE(reader.refresh_in_flight());

    std::thread opener([gate] {
        std::this_thread::sleep_for(20ms);
        gate->set_open(true);
    });
    reader.wait_idle();
    opener.join();

    CHECK(!reader.refresh_in_flight());
    CHECK(reader.last_known() == std::optional<int>(5));
}

TEST_CASE("a read that throws counts as a failed read")
{
    std::atomic<int> calls{0};
    TimedReader<int> reader(
        [&calls]() -> std::optional<int> {
            if (++calls == 2) {
                throw std::runtime_error("sensor went away");
            }
            return calls.load();
        },
        1000ms, 0ms);

    REQUIRE(reader.get() == std::optional<int>(1));
    CHECK(reader.get() == std::optional<int>(1));
    CHECK(!reader.refresh_in_flight());
    reader.wait_idle();

    CHECK(reader.get() == std::optional<int>(3));
    CHECK(reader.reads_started() == 3);
}
