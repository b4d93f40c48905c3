#include "pulse/Ticker.hpp"

#include "pulse/util/Logger.hpp"
#include "pulse/util/Metrics.hpp"

#include <boost/asio/post.hpp>

#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>

namespace pulse {

namespace {

std::string usString(Ticker::Duration d) {
  return std::to_string(std::chrono::duration_cast<std::chrono::microseconds>(d).count());
}

} // namespace

// Handshake between a reset() caller and the control loop. Whoever moves
// the state off Pending first decides the outcome.
struct Ticker::ResetRequest {
  enum Outcome { Pending, Accepted, Rejected };

  explicit ResetRequest(Duration d) : interval(d) {}

  const Duration          interval;
  std::mutex              mx;
  std::condition_variable cv;
  Outcome                 outcome = Pending;
};

rt::CancelScope Ticker::checkedScope(Duration interval, const rt::CancelScope& parent) {
  if (interval <= Duration::zero()) {
    throw std::invalid_argument("Ticker: interval must be positive");
  }
  if (!parent) {
    throw std::invalid_argument("Ticker: parent cancel scope is required");
  }
  return rt::CancelScope::withParent(parent);
}

Ticker::Ticker(Duration interval)
  : Ticker(interval, rt::CancelScope::background()) {}

Ticker::Ticker(Duration interval, const rt::CancelScope& parent)
  : scope_(checkedScope(interval, parent))
  , work_(boost::asio::make_work_guard(ioc_))
  , timer_(ioc_)
  , interval_(interval)
{
  arm(interval_);

  // Fires on close() or when the parent scope is cancelled.
  onCancel_ = scope_.onCancel([this]{
    boost::asio::post(ioc_, [this]{ terminate(); });
  });

  PULSE_METRIC_HIT("ticker.created");
  util::logger().log(util::LogLevel::Debug, "ticker.start", { {"interval_us", usString(interval_)} });

  loop_ = std::thread([this]{ run(); });
}

Ticker::~Ticker() {
  (void)close();
  if (loop_.joinable()) loop_.join();
}

Result<void> Ticker::reset(Duration interval) {
  if (scope_.cancelled()) return Error::closed();

  auto req = std::make_shared<ResetRequest>(interval);
  auto wake = scope_.onCancel([req]{
    std::lock_guard<std::mutex> lk(req->mx);
    req->cv.notify_all();
  });

  boost::asio::post(ioc_, [this, req]{ onReset(req); });

  std::unique_lock<std::mutex> lk(req->mx);
  req->cv.wait(lk, [&]{ return req->outcome != ResetRequest::Pending || scope_.cancelled(); });
  if (req->outcome == ResetRequest::Accepted) return {};

  // Retirement won the race; the loop will skip this request if it ever sees it.
  req->outcome = ResetRequest::Rejected;
  return Error::closed();
}

Result<void> Ticker::stop() {
  return reset(Duration::zero());
}

Result<void> Ticker::close() {
  bool expected = false;
  if (!closing_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    retired_.wait();
    return Error::closed();
  }

  scope_.cancel();
  loopDone_.wait();
  output_.close();
  // Loop has exited; nothing else touches the timer now.
  timer_.cancel();

  PULSE_METRIC_HIT("ticker.retired");
  util::logger().log(util::LogLevel::Debug, "ticker.retired", { {"ticks", std::to_string(delivered_)} });

  retired_.countDown();
  return {};
}

bool Ticker::isClosed() const {
  return scope_.cancelled();
}

void Ticker::wait() const {
  loopDone_.wait();
}

void Ticker::run() {
  try {
    ioc_.run();
  } catch (const std::exception& ex) {
    util::logger().log(util::LogLevel::Error, "ticker.loop.exception", { {"what", ex.what()} });
  }

  // No-op after a normal exit; after an escaped exception it keeps
  // isClosed() and close() consistent with the dead loop.
  scope_.cancel();
  loopDone_.countDown();

  // Parent-scope retirement: nobody may ever call close(), so finish the
  // sequence here. Closed just means a caller got there first.
  (void)close();
}

void Ticker::arm(Duration d) {
  const std::uint64_t gen = ++generation_;
  timer_.expires_after(d);
  timer_.async_wait([this, gen](const boost::system::error_code& ec){ onFire(ec, gen); });
}

void Ticker::disarm() {
  // A firing already queued behind us carries the old generation and is dropped.
  ++generation_;
  timer_.cancel();
}

void Ticker::onFire(const boost::system::error_code& ec, std::uint64_t generation) {
  if (ec == boost::asio::error::operation_aborted) return;
  if (generation != generation_ || state_ != State::Active) {
    PULSE_METRIC_HIT("ticker.stale_fires");
    return;
  }
  if (ec) {
    util::logger().log(util::LogLevel::Error, "ticker.timer.error", { {"error", ec.message()} });
    terminate();
    return;
  }
  if (scope_.cancelled()) {
    terminate();
    return;
  }

  Tick tick{delivered_ + 1, std::chrono::steady_clock::now()};
  if (!output_.send(tick, scope_)) {
    terminate();
    return;
  }
  ++delivered_;
  PULSE_METRIC_HIT("ticker.ticks");
  if (util::logger().enabled(util::LogLevel::Trace)) {
    util::logger().log(util::LogLevel::Trace, "ticker.tick", { {"seq", std::to_string(tick.seq)} });
  }

  arm(interval_);
}

void Ticker::onReset(const std::shared_ptr<ResetRequest>& req) {
  std::lock_guard<std::mutex> lk(req->mx);
  if (req->outcome != ResetRequest::Pending) return;

  if (state_ == State::Terminated || scope_.cancelled()) {
    req->outcome = ResetRequest::Rejected;
    req->cv.notify_all();
    terminate();
    return;
  }

  disarm();
  if (req->interval > Duration::zero()) {
    interval_ = req->interval;
    state_    = State::Active;
    arm(interval_);
    PULSE_METRIC_HIT("ticker.resets");
    util::logger().log(util::LogLevel::Debug, "ticker.reset", { {"interval_us", usString(interval_)} });
  } else {
    state_ = State::Paused;
    PULSE_METRIC_HIT("ticker.pauses");
    util::logger().log(util::LogLevel::Debug, "ticker.pause");
  }

  req->outcome = ResetRequest::Accepted;
  req->cv.notify_all();
}

void Ticker::terminate() {
  if (state_ == State::Terminated) return;
  state_ = State::Terminated;
  disarm();
  work_.reset();
  ioc_.stop();
  util::logger().log(util::LogLevel::Debug, "ticker.loop.exit", { {"ticks", std::to_string(delivered_)} });
}

} // namespace pulse
