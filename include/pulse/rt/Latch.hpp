#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <stdexcept>

namespace pulse::rt {

// Single-use countdown latch: waiters are released once the count hits zero.
class Latch {
public:
  explicit Latch(std::ptrdiff_t count) : count_(count) {
    if (count < 0)
      throw std::invalid_argument("Latch: count must be >= 0");
  }

  Latch(const Latch&)            = delete;
  Latch& operator=(const Latch&) = delete;

  // Extra count-downs past zero are ignored.
  void countDown(std::ptrdiff_t n = 1) {
    if (n <= 0) return;
    bool released = false;
    {
      std::lock_guard<std::mutex> lk(mx_);
      if (count_ == 0) return;
      count_ = (n >= count_) ? 0 : count_ - n;
      released = (count_ == 0);
    }
    if (released) cv_.notify_all();
  }

  void wait() const {
    std::unique_lock<std::mutex> lk(mx_);
    cv_.wait(lk, [this]{ return count_ == 0; });
  }

  bool waitFor(std::chrono::nanoseconds timeout) const {
    std::unique_lock<std::mutex> lk(mx_);
    return cv_.wait_for(lk, timeout, [this]{ return count_ == 0; });
  }

  bool tryWait() const {
    std::lock_guard<std::mutex> lk(mx_);
    return count_ == 0;
  }

private:
  mutable std::mutex              mx_;
  mutable std::condition_variable cv_;
  std::ptrdiff_t                  count_;
};

} // namespace pulse::rt
