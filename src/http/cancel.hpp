#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

// Shared cancellation signal. Copies refer to the same underlying state, so
// one token can be handed to every thread taking part in an operation.
//
// Once cancel() is called the token stays cancelled; sleeps wake up early and
// registered callbacks run exactly once.
class CancelToken {
    struct State;

public:
    // Unregisters its callback on destruction. Destruction waits for a
    // concurrently running cancel() to finish invoking callbacks.
    class Subscription {
    public:
        Subscription() = default;
        Subscription(std::shared_ptr<State> state, uint64_t id)
            : state_(std::move(state)), id_(id) {}
        ~Subscription();

        Subscription(Subscription&& o) noexcept : state_(std::move(o.state_)), id_(o.id_) {}
        Subscription& operator=(Subscription&&) = delete;
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

    private:
        std::shared_ptr<State> state_;
        uint64_t               id_ = 0;
    };

    CancelToken();

    void cancel();
    bool cancelled() const { return state_->flag.load(std::memory_order_acquire); }

    // Throws Cancelled if the token has been cancelled.
    void throw_if_cancelled() const;

    // Sleep for `d` unless cancelled first. Returns false if cancelled.
    bool sleep_for(std::chrono::nanoseconds d) const;

    // Run `fn` when the token is cancelled (immediately if it already is).
    // `fn` runs on the cancelling thread and must not block.
    Subscription subscribe(std::function<void()> fn) const;

private:
    struct State {
        std::atomic<bool>                        flag{false};
        std::mutex                               mtx;
        std::condition_variable                  cv;
        uint64_t                                 next_id = 1;
        std::map<uint64_t, std::function<void()>> callbacks;
    };

    std::shared_ptr<State> state_;
};
