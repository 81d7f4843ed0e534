#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace nicefind {

namespace detail {

template <typename T>
struct ChannelState {
    explicit ChannelState(std::size_t limit)
        : capacity{limit} {}

    std::mutex mutex;
    std::condition_variable readable;
    std::condition_variable writable;
    std::deque<T> queue;
    std::size_t capacity;
    bool sender_closed = false;
    bool receiver_closed = false;
};

} // namespace detail

// Single-producer/single-consumer bounded FIFO. Each end closes itself when
// destroyed, so the other side always observes the hang-up.
template <typename T>
class Sender {
public:
    Sender() = default;
    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state)
        : state_{std::move(state)} {}

    Sender(const Sender&) = delete;
    Sender& operator=(const Sender&) = delete;
    Sender(Sender&& other) noexcept = default;
    Sender& operator=(Sender&& other) noexcept {
        if (this != &other) {
            close();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    ~Sender() { close(); }

    // Blocks while the queue is full. Returns false, dropping the value, once
    // the receiver has gone away.
    bool send(T value) {
        if (!state_) {
            return false;
        }
        std::unique_lock lock{state_->mutex};
        state_->writable.wait(lock, [this] {
            return state_->receiver_closed || state_->queue.size() < state_->capacity;
        });
        if (state_->receiver_closed) {
            return false;
        }
        state_->queue.push_back(std::move(value));
        lock.unlock();
        state_->readable.notify_one();
        return true;
    }

    [[nodiscard]] bool receiver_closed() const {
        if (!state_) {
            return true;
        }
        std::scoped_lock lock{state_->mutex};
        return state_->receiver_closed;
    }

    void close() noexcept {
        if (!state_) {
            return;
        }
        {
            std::scoped_lock lock{state_->mutex};
            state_->sender_closed = true;
        }
        state_->readable.notify_all();
        state_.reset();
    }

private:
    std::shared_ptr<detail::ChannelState<T>> state_;
};

template <typename T>
class Receiver {
public:
    Receiver() = default;
    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state)
        : state_{std::move(state)} {}

    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;
    Receiver(Receiver&& other) noexcept = default;
    Receiver& operator=(Receiver&& other) noexcept {
        if (this != &other) {
            close();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    ~Receiver() { close(); }

    // Blocks until a value arrives. std::nullopt means the sender closed and
    // everything it sent has been consumed.
    std::optional<T> receive() {
        if (!state_) {
            return std::nullopt;
        }
        std::unique_lock lock{state_->mutex};
        state_->readable.wait(lock, [this] { return state_->sender_closed || !state_->queue.empty(); });
        if (state_->queue.empty()) {
            return std::nullopt;
        }
        T value = std::move(state_->queue.front());
        state_->queue.pop_front();
        lock.unlock();
        state_->writable.notify_one();
        return value;
    }

    // Discards anything still queued and wakes a blocked sender.
    void close() noexcept {
        if (!state_) {
            return;
        }
        {
            std::scoped_lock lock{state_->mutex};
            state_->receiver_closed = true;
            state_->queue.clear();
        }
        state_->writable.notify_all();
        state_.reset();
    }

private:
    std::shared_ptr<detail::ChannelState<T>> state_;
};

template <typename T>
std::pair<Sender<T>, Receiver<T>> make_channel(std::size_t capacity) {
    if (capacity == 0) {
        throw std::invalid_argument{"channel capacity must be at least 1"};
    }
    auto state = std::make_shared<detail::ChannelState<T>>(capacity);
    return {Sender<T>{state}, Receiver<T>{state}};
}

} // namespace nicefind
