#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace drive {

// Blocking FIFO with a fixed capacity, shared between threads.
//
// close() wakes every waiter: pending pushes fail, pops keep returning the
// remaining items and then std::nullopt.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity ? capacity : 1) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Blocks while the queue is full. Returns false if the queue was closed.
    bool push(T item) {
        std::unique_lock<std::mutex> lk(mtx_);
        not_full_.wait(lk, [this] { return closed_ || items_.size() < capacity_; });
        if (closed_) return false;
        items_.push_back(std::move(item));
        lk.unlock();
        not_empty_.notify_one();
        return true;
    }

    // Never blocks. Returns false if the queue is full or closed; `item` is
    // left untouched in that case.
    bool try_push(T& item) {
        std::unique_lock<std::mutex> lk(mtx_);
        if (closed_ || items_.size() >= capacity_) return false;
        items_.push_back(std::move(item));
        lk.unlock();
        not_empty_.notify_one();
        return true;
    }

    // Blocks while the queue is empty and open.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lk(mtx_);
        not_empty_.wait(lk, [this] { return closed_ || !items_.empty(); });
        return take(lk);
    }

    // Never blocks.
    std::optional<T> try_pop() {
        std::unique_lock<std::mutex> lk(mtx_);
        return take(lk);
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

private:
    std::optional<T> take(std::unique_lock<std::mutex>& lk) {
        if (items_.empty()) return std::nullopt;
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        lk.unlock();
        not_full_.notify_one();
        return item;
    }

    const size_t            capacity_;
    std::mutex              mtx_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T>           items_;
    bool                    closed_ = false;
};

}  // namespace drive
