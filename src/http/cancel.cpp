#include "cancel.hpp"
#include "http_error.hpp"

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

CancelToken::Subscription::~Subscription() {
    if (!state_) return;
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->callbacks.erase(id_);
}

void CancelToken::cancel() {
    std::lock_guard<std::mutex> lk(state_->mtx);
    if (state_->flag.exchange(true, std::memory_order_acq_rel)) return;
    state_->cv.notify_all();

    // Callbacks run under the lock so that a Subscription being destroyed on
    // another thread cannot race with its own callback.
    auto callbacks = std::move(state_->callbacks);
    state_->callbacks.clear();
    for (auto& kv : callbacks) kv.second();
}

void CancelToken::throw_if_cancelled() const {
    if (cancelled()) throw Cancelled();
}

bool CancelToken::sleep_for(std::chrono::nanoseconds d) const {
    std::unique_lock<std::mutex> lk(state_->mtx);
    return !state_->cv.wait_for(lk, d, [this] {
        return state_->flag.load(std::memory_order_acquire);
    });
}

CancelToken::Subscription CancelToken::subscribe(std::function<void()> fn) const {
    std::unique_lock<std::mutex> lk(state_->mtx);
    if (cancelled()) {
        lk.unlock();
        fn();
        return {};
    }
    const uint64_t id = state_->next_id++;
    state_->callbacks.emplace(id, std::move(fn));
    return Subscription(state_, id);
}
