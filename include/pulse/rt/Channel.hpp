// File: include/pulse/rt/Channel.hpp
#pragma once

#include "pulse/rt/CancelScope.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <mutex>
#include <optional>
#include <utility>

namespace pulse::rt {

enum class RecvStatus { Value, Timeout, Closed };

// Unbuffered rendezvous channel (single slot, no queueing).
// - send() returns only once a receiver has taken the value, or when the
//   scope is cancelled / the channel is closed first (value withdrawn).
// - Any number of senders and receivers; senders take the slot in turn.
// - A value whose sender's scope is already cancelled is never handed out,
//   so cancellation always wins against a receiver arriving late.
// - close() is one-shot; receivers then see end-of-stream and a value still
//   sitting in the slot is never handed out.
template <typename T>
class Channel {
public:
  class iterator;

  Channel() = default;

  Channel(const Channel&)            = delete;
  Channel& operator=(const Channel&) = delete;
  Channel(Channel&&)                 = delete;
  Channel& operator=(Channel&&)      = delete;

  bool send(T value, const CancelScope& scope) {
    auto wake = scope.onCancel([this]{
      std::lock_guard<std::mutex> lk(mx_);
      cv_.notify_all();
    });

    std::unique_lock<std::mutex> lk(mx_);
    cv_.wait(lk, [&]{ return !slot_ || closed_ || scope.cancelled(); });
    if (closed_ || scope.cancelled()) return false;

    slot_.emplace(std::move(value));
    owner_ = &scope;
    const std::uint64_t before = taken_;
    cv_.notify_all();

    cv_.wait(lk, [&]{ return taken_ != before || closed_ || scope.cancelled(); });
    if (taken_ != before) return true;

    slot_.reset();
    owner_ = nullptr;
    cv_.notify_all();
    return false;
  }

  // Next value, or nullopt once the channel is closed.
  std::optional<T> receive() {
    std::unique_lock<std::mutex> lk(mx_);
    cv_.wait(lk, [this]{ return readyLocked(); });
    return takeLocked();
  }

  RecvStatus receiveFor(std::chrono::nanoseconds timeout, T& out) {
    std::unique_lock<std::mutex> lk(mx_);
    if (!cv_.wait_for(lk, timeout, [this]{ return readyLocked(); })) {
      return RecvStatus::Timeout;
    }
    auto v = takeLocked();
    if (!v) return RecvStatus::Closed;
    out = std::move(*v);
    return RecvStatus::Value;
  }

  // Returns false when already closed.
  bool close() {
    {
      std::lock_guard<std::mutex> lk(mx_);
      if (closed_) return false;
      closed_ = true;
    }
    cv_.notify_all();
    return true;
  }

  bool closed() const {
    std::lock_guard<std::mutex> lk(mx_);
    return closed_;
  }

  // Range-for support: iteration ends when the channel closes.
  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = T;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const T*;
    using reference         = const T&;

    iterator() = default;

    reference operator*() const { return *cur_; }
    pointer operator->() const { return &*cur_; }

    iterator& operator++() {
      advance();
      return *this;
    }

    bool operator==(const iterator& o) const { return ch_ == o.ch_; }
    bool operator!=(const iterator& o) const { return ch_ != o.ch_; }

  private:
    friend class Channel;
    explicit iterator(Channel* ch) : ch_(ch) { advance(); }

    void advance() {
      cur_ = ch_->receive();
      if (!cur_) ch_ = nullptr;
    }

    Channel*         ch_ = nullptr;
    std::optional<T> cur_;
  };

private:
  bool readyLocked() const {
    if (closed_) return true;
    return slot_.has_value() && !(owner_ && owner_->cancelled());
  }

  std::optional<T> takeLocked() {
    if (closed_) return std::nullopt;
    std::optional<T> out(std::move(slot_));
    slot_.reset();
    owner_ = nullptr;
    ++taken_;
    cv_.notify_all();
    return out;
  }

  mutable std::mutex      mx_;
  std::condition_variable cv_;
  std::optional<T>        slot_;
  const CancelScope*      owner_  = nullptr; // scope of the sender holding the slot
  std::uint64_t           taken_  = 0;
  bool                    closed_ = false;
};

} // namespace pulse::rt
