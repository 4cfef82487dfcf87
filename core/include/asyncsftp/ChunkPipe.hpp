// Bounded FIFO of byte chunks between the disk context and the session
// context of one transfer. One producer, one consumer.
#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

namespace asyncsftp {

class ChunkPipe {
public:
    using Chunk = std::vector<char>;

    explicit ChunkPipe(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    ChunkPipe(const ChunkPipe &) = delete;
    ChunkPipe &operator=(const ChunkPipe &) = delete;

    // context of producer, blocking while full; false once aborted
    bool push(Chunk chunk) {
        {
            std::unique_lock<std::mutex> lk(lock_);
            conditionSpace_.wait(
                lk, [this] { return aborted_ || chunks_.size() < capacity_; });
            if (aborted_ || closed_)
                return false;
            chunks_.push_back(std::move(chunk));
        }
        conditionData_.notify_one(); // outside the lock
        return true;
    }

    // context of consumer, blocking while empty; false at end of stream or
    // once aborted
    bool pop(Chunk &chunk) {
        {
            std::unique_lock<std::mutex> lk(lock_);
            conditionData_.wait(
                lk, [this] { return aborted_ || closed_ || !chunks_.empty(); });
            if (aborted_ || chunks_.empty())
                return false;
            chunk = std::move(chunks_.front());
            chunks_.pop_front();
        }
        conditionSpace_.notify_one();
        return true;
    }

    // context of producer: no more chunks; queued ones are still delivered
    void close() {
        {
            std::lock_guard<std::mutex> lk(lock_);
            closed_ = true;
        }
        conditionData_.notify_all();
    }

    // either side: drop queued chunks and release a blocked peer
    void abort() {
        {
            std::lock_guard<std::mutex> lk(lock_);
            aborted_ = true;
            chunks_.clear();
        }
        conditionData_.notify_all();
        conditionSpace_.notify_all();
    }

    bool aborted() const {
        std::lock_guard<std::mutex> lk(lock_);
        return aborted_;
    }

private:
    const std::size_t capacity_;
    mutable std::mutex lock_;
    std::condition_variable conditionData_;
    std::condition_variable conditionSpace_;
    std::deque<Chunk> chunks_;
    bool closed_ = false;
    bool aborted_ = false;
};

} // namespace asyncsftp
