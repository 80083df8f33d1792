#ifndef DOCKWATCH_STREAM_HPP
#define DOCKWATCH_STREAM_HPP

#include "cancel.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace DockWatch {

    enum class ReceiveStatus { Item, Error, Closed, Cancelled };

    template <typename T>
    struct Received {
        ReceiveStatus status = ReceiveStatus::Closed;
        std::optional<T> item;
        std::string error;
    };

    // Bounded data queue and a one-slot error channel behind one lock.
    // A receive races both; buffered items are drained before Closed is reported.
    template <typename T>
    class StreamChannel {
    public:
        explicit StreamChannel(size_t capacity = 100) : capacity_(capacity == 0 ? 1 : capacity) {}

        // Blocks while the queue is full. False once the channel is cancelled or closed.
        bool push(T item) {
            std::unique_lock<std::mutex> lock(mutex_);
            space_.wait(lock, [this] { return cancelled_ || closed_ || data_.size() < capacity_; });
            if (cancelled_ || closed_) return false;
            data_.push_back(std::move(item));
            ready_.notify_one();
            return true;
        }

        // Only the first error is kept.
        void fail(std::string message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (error_ || cancelled_) return;
            error_ = std::move(message);
            ready_.notify_all();
        }

        void close() {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            ready_.notify_all();
            space_.notify_all();
        }

        void cancel() {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
            data_.clear();
            ready_.notify_all();
            space_.notify_all();
        }

        // Waits in short slices so an external token (scheduler shutdown) is noticed.
        Received<T> receive(const CancelToken& token) {
            std::unique_lock<std::mutex> lock(mutex_);
            while (true) {
                Received<T> out;
                if (cancelled_ || token.cancelled()) {
                    out.status = ReceiveStatus::Cancelled;
                    return out;
                }
                if (!data_.empty()) {
                    out.status = ReceiveStatus::Item;
                    out.item = std::move(data_.front());
                    data_.pop_front();
                    space_.notify_one();
                    return out;
                }
                if (error_) {
                    out.status = ReceiveStatus::Error;
                    out.error = *error_;
                    error_.reset();
                    return out;
                }
                if (closed_) {
                    out.status = ReceiveStatus::Closed;
                    return out;
                }
                ready_.wait_for(lock, std::chrono::milliseconds(100));
            }
        }

    private:
        size_t capacity_;
        mutable std::mutex mutex_;
        std::condition_variable ready_;
        std::condition_variable space_;
        std::deque<T> data_;
        std::optional<std::string> error_;
        bool closed_ = false;
        bool cancelled_ = false;
    };

    // A channel plus the producer thread feeding it. The producer gets the
    // channel and a token; it must return soon after the token is cancelled.
    template <typename T>
    class Stream {
    public:
        using Producer = std::function<void(StreamChannel<T>&, const CancelToken&)>;

        explicit Stream(size_t capacity = 100) : channel_(capacity) {}

        ~Stream() {
            cancel();
            if (producer_.joinable()) producer_.join();
        }

        Stream(const Stream&) = delete;
        Stream& operator=(const Stream&) = delete;

        void start(Producer producer) {
            producer_ = std::thread([this, producer] {
                producer(channel_, token_);
                channel_.close();
            });
        }

        void cancel() {
            token_.cancel();
            channel_.cancel();
        }

        StreamChannel<T>& channel() { return channel_; }
        const CancelToken& token() const { return token_; }

    private:
        StreamChannel<T> channel_;
        CancelToken token_;
        std::thread producer_;
    };

}

#endif
