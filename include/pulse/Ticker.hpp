// File: include/pulse/Ticker.hpp
#pragma once

#include "pulse/Result.hpp"
#include "pulse/rt/CancelScope.hpp"
#include "pulse/rt/Channel.hpp"
#include "pulse/rt/Latch.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace pulse {

struct Tick {
  std::uint64_t                         seq = 0; // 1-based delivery order
  std::chrono::steady_clock::time_point at{};    // when the countdown fired
};

// Periodic tick emitter with a runtime-adjustable period.
//
// A private control loop thread owns the one-shot timer and is the only
// writer of output(). Ticks are handed over unbuffered: the loop blocks
// until a consumer takes the tick (or the ticker is retired), then rearms.
//
// reset(d <= 0) / stop() pauses; a later reset(d > 0) resumes from that
// call. close() (or cancellation of the parent scope) retires the ticker
// for good and closes output(), which ends any range-for over it.
class Ticker {
public:
  using Duration = std::chrono::nanoseconds;
  using Stream   = rt::Channel<Tick>;

  // Throws std::invalid_argument if interval <= 0 or parent is empty.
  explicit Ticker(Duration interval);
  Ticker(Duration interval, const rt::CancelScope& parent);

  // Retires the ticker (if still live) and joins the control loop.
  ~Ticker();

  Ticker(const Ticker&)            = delete;
  Ticker& operator=(const Ticker&) = delete;
  Ticker(Ticker&&)                 = delete;
  Ticker& operator=(Ticker&&)      = delete;

  // Blocks until the control loop takes the request; ErrorCode::Closed once
  // the ticker is retired (including a retirement racing this call).
  Result<void> reset(Duration interval);
  Result<void> stop();

  // Success for exactly one call over the ticker's lifetime, Closed for the
  // rest. Every caller returns only after output() is closed.
  Result<void> close();

  bool isClosed() const;
  void wait() const;

  Stream& output() noexcept { return output_; }

private:
  enum class State { Active, Paused, Terminated };
  struct ResetRequest;

  static rt::CancelScope checkedScope(Duration interval, const rt::CancelScope& parent);

  void run();
  void arm(Duration d);
  void disarm();
  void onFire(const boost::system::error_code& ec, std::uint64_t generation);
  void onReset(const std::shared_ptr<ResetRequest>& req);
  void terminate();

  rt::CancelScope   scope_;
  Stream            output_;
  rt::Latch         loopDone_{1};
  rt::Latch         retired_{1};
  std::atomic<bool> closing_{false};

  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
  boost::asio::steady_timer timer_;
  rt::CancelScope::Registration onCancel_;

  // Control loop state; touched only on the loop thread once it runs.
  Duration      interval_;
  State         state_      = State::Active;
  std::uint64_t generation_ = 0; // bumped on every arm/disarm; stale firings are dropped
  std::uint64_t delivered_  = 0;

  std::thread loop_;
};

} // namespace pulse
