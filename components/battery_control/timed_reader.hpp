/**
 * @file timed_reader.hpp
 * @brief Cached value refreshed by a bounded-time background read
 *
 * Some telemetry reads can stall for seconds. get() starts the read on a
 * detached worker and waits at most the configured timeout; on timeout the
 * last known good value is returned and the worker keeps running to refresh
 * the cache for the next caller. At most one worker is in flight.
 * A read that throws, or a worker that cannot be started, counts as a failed
 * read and leaves the last known value in place.
 *
 * The worker only holds a shared_ptr to the state, so a TimedReader can be
 * destroyed while a read is still outstanding.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

namespace battctl {

template <typename T>
class TimedReader {
public:
    using ReadFunction = std::function<std::optional<T>()>;
    using Clock = std::chrono::steady_clock;

    TimedReader(ReadFunction read, std::chrono::milliseconds timeout, std::chrono::milliseconds max_age)
        : state_(std::make_shared<State>())
        , timeout_(timeout)
        , max_age_(max_age)
    {
        state_->read = std::move(read);
    }

    TimedReader(const TimedReader &) = delete;
    TimedReader &operator=(const TimedReader &) = delete;

    std::optional<T> get()
    {
        std::unique_lock<std::mutex> lock(state_->mutex);

        if (state_->value && Clock::now() - state_->updated < max_age_) {
            return state_->value;
        }

        if (!state_->in_flight) {
            try {
                std::thread worker(&TimedReader::run_worker, state_);
                state_->in_flight = true;
                ++state_->started;
                worker.detach();
            } catch (const std::system_error &) {
                return state_->value;
            }
        }

        state_->done.wait_for(lock, timeout_, [this] { return !state_->in_flight; });
        return state_->value;
    }

    std::optional<T> last_known() const
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->value;
    }

    bool refresh_in_flight() const
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->in_flight;
    }

    uint32_t reads_started() const
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->started;
    }

    /// Blocks until no worker is running
    void wait_idle()
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->done.wait(lock, [this] { return !state_->in_flight; });
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable done;
        ReadFunction read;
        std::optional<T> value;
        typename Clock::time_point updated{};
        bool in_flight{false};
        uint32_t started{0};
    };

    static void run_worker(std::shared_ptr<State> state)
    {
        std::optional<T> result;
        try {
            result = state->read();
        } catch (const std::exception &) {
            result.reset();
        }

        std::lock_guard<std::mutex> lock(state->mutex);
        if (result) {
            state->value = std::move(result);
            state->updated = Clock::now();
        }
        state->in_flight = false;
        state->done.notify_all();
    }

    std::shared_ptr<State> state_;
    std::chrono::milliseconds timeout_;
    std::chrono::milliseconds max_age_;
};

} // namespace battctl
