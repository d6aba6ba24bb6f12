/**
 * \file channel.hpp
 * \brief Bounded multi-producer / single-consumer channel used between pipeline stages.
 *
 * A channel is created as a Sender / Receiver pair. Every live Sender copy counts as one
 * producer; the channel closes when the last of them is destroyed or reset. send() blocks
 * while the queue is full, recv() blocks while it is empty and open.
 */
#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace docsync {

namespace detail {

template <typename T>
class ChannelState {
public:
    explicit ChannelState(std::size_t capacity) : capacity_(capacity) {
        if(capacity_ == 0) throw std::invalid_argument("channel capacity must be > 0");
    }

    bool push(T value) {
        std::unique_lock<std::mutex> lk(mutex_);
        not_full_.wait(lk, [this]{ return hung_up_ || queue_.size() < capacity_; });
        if(hung_up_) return false;
        queue_.push_back(std::move(value));
        lk.unlock();
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lk(mutex_);
        not_empty_.wait(lk, [this]{ return !queue_.empty() || senders_ == 0 || hung_up_; });
        if(queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        lk.unlock();
        not_full_.notify_one();
        return value;
    }

    void add_sender() {
        std::lock_guard<std::mutex> lk(mutex_);
        ++senders_;
    }

    void release_sender() {
        bool closed = false;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            closed = (--senders_ == 0);
        }
        if(closed) not_empty_.notify_all();
    }

    // Receiver side hang-up: pending values are dropped and producers are released.
    void hang_up() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            hung_up_ = true;
            queue_.clear();
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return queue_.size();
    }

    std::size_t capacity() const noexcept { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> queue_;
    std::size_t senders_ = 0;
    bool hung_up_ = false;
};

} // namespace detail

template <typename T> class Receiver;

/** \brief Producer handle. Copies share the channel; the last one closes it. */
template <typename T>
class Sender {
public:
    Sender() = default;
    Sender(const Sender &other) : state_(other.state_) { if(state_) state_->add_sender(); }
    Sender(Sender &&other) noexcept : state_(std::move(other.state_)) {}
    Sender &operator=(Sender other) noexcept { std::swap(state_, other.state_); return *this; }
    ~Sender() { reset(); }

    /**
     * \brief Enqueue a value, blocking while the channel is full.
     * \return false if the receiver hung up; the value is discarded in that case.
     */
    bool send(T value) {
        if(!state_) return false;
        return state_->push(std::move(value));
    }

    /** \brief Drop this producer. Closes the channel when no producer is left. */
    void reset() {
        if(state_) { state_->release_sender(); state_.reset(); }
    }

    explicit operator bool() const noexcept { return static_cast<bool>(state_); }

private:
    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) {
        state_->add_sender();
    }

    std::shared_ptr<detail::ChannelState<T>> state_;

    template <typename U>
    friend std::pair<Sender<U>, Receiver<U>> make_channel(std::size_t capacity);
};

/** \brief Consumer handle. Move-only; there is exactly one per channel. */
template <typename T>
class Receiver {
public:
    Receiver() = default;
    Receiver(const Receiver &) = delete;
    Receiver &operator=(const Receiver &) = delete;
    Receiver(Receiver &&) noexcept = default;
    Receiver &operator=(Receiver &&) noexcept = default;
    ~Receiver() { close(); }

    /**
     * \brief Wait for the next value.
     * \return The value, or std::nullopt once every Sender is gone and the queue is drained.
     */
    std::optional<T> recv() {
        if(!state_) return std::nullopt;
        return state_->pop();
    }

    /** \brief Hang up: blocked and future send() calls return false. */
    void close() {
        if(state_) state_->hang_up();
    }

    std::size_t size() const { return state_ ? state_->size() : 0; }
    std::size_t capacity() const { return state_ ? state_->capacity() : 0; }

private:
    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::ChannelState<T>> state_;

    template <typename U>
    friend std::pair<Sender<U>, Receiver<U>> make_channel(std::size_t capacity);
};

/** \brief Create a bounded channel holding at most \p capacity queued values. */
template <typename T>
std::pair<Sender<T>, Receiver<T>> make_channel(std::size_t capacity) {
    auto state = std::make_shared<detail::ChannelState<T>>(capacity);
    return {Sender<T>(state), Receiver<T>(state)};
}

} // namespace docsync
