#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace core {

// Thread-safe FIFO for handing messages between threads.
// Design: the producer (audio thread, recognizer callback) never blocks.
//         When the channel holds more than max_size items, the oldest item the
//         droppable predicate accepts is discarded and counted. Items the
//         predicate rejects are never dropped, so the channel may grow past
//         max_size when it holds only those.
template <typename T>
class MessageChannel {
public:
    using DropPredicate = std::function<bool(const T&)>;

    explicit MessageChannel(size_t max_size = 50, DropPredicate droppable = nullptr)
        : max_size_(max_size), droppable_(std::move(droppable)) {}

    // Returns false once the channel is closed.
    bool push(T&& item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(item));
            if (max_size_ > 0) {
                while (queue_.size() > max_size_) {
                    if (!drop_oldest_locked()) break;
                }
            }
        }
        cv_.notify_one();
        return true;
    }

    // Blocks until an item is available. Returns false when closed and drained.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) {
            return false;
        }
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    // Waits at most `timeout`. Returns nullopt on timeout or when closed and drained.
    template <typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) {
            return std::nullopt;
        }
        std::optional<T> out(std::move(queue_.front()));
        queue_.pop_front();
        return out;
    }

    // No further pushes; pending items can still be popped.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // Re-arms a closed channel and discards anything left in it.
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
        closed_ = false;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t max_size() const { return max_size_; }

    size_t dropped_count() const { return dropped_count_.load(); }

private:
    bool drop_oldest_locked() {
        for (auto it = queue_.begin(); it != queue_.end(); ++it) {
            if (!droppable_ || droppable_(*it)) {
                queue_.erase(it);
                dropped_count_++;
                return true;
            }
        }
        return false;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    const size_t max_size_;      // 0 = unbounded
    DropPredicate droppable_;    // empty = every item may be dropped
    bool closed_ = false;
    std::atomic<size_t> dropped_count_{0};
};

} // namespace core
