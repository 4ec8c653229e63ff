/**
 * @file channel.hpp
 * @brief One-way FIFO channel between a worker thread and its coordinator
 *
 * The splitter runs on its own thread and hands finished pieces to the
 * coordinator. A single ordered channel carries every message kind, so the
 * terminal message can never overtake a piece that was sent before it.
 *
 * EXAMPLE:
 * Channel<SplitEvent> channel;
 * channel.send(PieceReady{...});   // Producer
 * auto event = channel.receive();  // Consumer (blocks until available)
 */

#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace s3sync::sync {

/**
 * @brief Unbounded FIFO channel, closed by the producer when it is done
 *
 * close() wakes every blocked receiver; items queued before it are still
 * delivered.
 */
template<typename T>
class Channel {
public:
    Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief Enqueue an item
     *
     * RETURNS: false if the channel was already closed (item dropped)
     */
    bool send(T item) {
        {
            std::unique_lock lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Dequeue, waiting until an item arrives
     *
     * RETURNS: Item, or nullopt once the channel is closed and drained
     */
    std::optional<T> receive() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() {
            return !queue_.empty() || closed_;
        });

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    std::queue<T> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace s3sync::sync
