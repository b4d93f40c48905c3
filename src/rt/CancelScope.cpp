#include "pulse/rt/CancelScope.hpp"

#include <algorithm>
#include <condition_variable>
#include <list>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace pulse::rt {

struct CancelScope::Callback {
  std::function<void()>   fn;
  std::mutex              mx;
  std::condition_variable cv;
  bool                    running = false;
  bool                    removed = false;
  std::thread::id         runner;
};

struct CancelScope::State {
  std::mutex                           mx;
  std::condition_variable              cv;
  bool                                 cancelled = false;
  std::list<std::shared_ptr<Callback>> callbacks;

  // Child side of the parent/child link; dropping the last handle to this
  // state unregisters it from the parent.
  Registration parentLink;
};

// ---------------------- Registration ----------------------

CancelScope::Registration::Registration(const std::shared_ptr<State>& state,
                                        std::shared_ptr<Callback> cb)
  : state_(state), cb_(std::move(cb)) {}

CancelScope::Registration::~Registration() {
  reset();
}

CancelScope::Registration::Registration(Registration&& other) noexcept
  : state_(std::move(other.state_)), cb_(std::move(other.cb_)) {}

CancelScope::Registration& CancelScope::Registration::operator=(Registration&& other) noexcept {
  if (this != &other) {
    reset();
    state_ = std::move(other.state_);
    cb_    = std::move(other.cb_);
  }
  return *this;
}

void CancelScope::Registration::reset() {
  if (!cb_) return;

  if (auto st = state_.lock()) {
    std::lock_guard<std::mutex> lk(st->mx);
    st->callbacks.remove(cb_);
  }

  {
    std::unique_lock<std::mutex> lk(cb_->mx);
    cb_->removed = true;
    // A callback may drop its own registration; only wait on other threads.
    if (cb_->running && cb_->runner != std::this_thread::get_id()) {
      cb_->cv.wait(lk, [this]{ return !cb_->running; });
    }
  }

  cb_.reset();
  state_.reset();
}

// ---------------------- CancelScope ----------------------

CancelScope CancelScope::background() {
  return CancelScope(std::make_shared<State>());
}

CancelScope CancelScope::withParent(const CancelScope& parent) {
  if (!parent.valid()) {
    throw std::invalid_argument("CancelScope: parent scope is required");
  }

  auto child = std::make_shared<State>();
  std::weak_ptr<State> weak = child;
  child->parentLink = parent.onCancel([weak]{
    if (auto c = weak.lock()) cancelState(c);
  });
  return CancelScope(std::move(child));
}

const std::shared_ptr<CancelScope::State>& CancelScope::require() const {
  if (!state_) throw std::logic_error("CancelScope: empty handle");
  return state_;
}

void CancelScope::cancel() const {
  cancelState(require());
}

bool CancelScope::cancelled() const {
  const auto& st = require();
  std::lock_guard<std::mutex> lk(st->mx);
  return st->cancelled;
}

CancelScope::Registration CancelScope::onCancel(std::function<void()> fn) const {
  const auto& st = require();
  auto cb = std::make_shared<Callback>();
  cb->fn = std::move(fn);

  {
    std::lock_guard<std::mutex> lk(st->mx);
    if (!st->cancelled) {
      st->callbacks.push_back(cb);
      return Registration(st, std::move(cb));
    }
  }

  invoke(cb);
  return Registration(st, std::move(cb));
}

void CancelScope::waitCancelled() const {
  const auto& st = require();
  std::unique_lock<std::mutex> lk(st->mx);
  st->cv.wait(lk, [&]{ return st->cancelled; });
}

bool CancelScope::waitCancelledFor(std::chrono::nanoseconds timeout) const {
  const auto& st = require();
  std::unique_lock<std::mutex> lk(st->mx);
  return st->cv.wait_for(lk, timeout, [&]{ return st->cancelled; });
}

void CancelScope::cancelState(const std::shared_ptr<State>& state) {
  std::list<std::shared_ptr<Callback>> run;
  {
    std::lock_guard<std::mutex> lk(state->mx);
    if (state->cancelled) return;
    state->cancelled = true;
    run.swap(state->callbacks);
  }
  state->cv.notify_all();

  // Callbacks run outside the scope lock so they may query or cancel freely.
  for (auto& cb : run) invoke(cb);
}

void CancelScope::invoke(const std::shared_ptr<Callback>& cb) {
  {
    std::lock_guard<std::mutex> lk(cb->mx);
    if (cb->removed || !cb->fn) return;
    cb->running = true;
    cb->runner  = std::this_thread::get_id();
  }

  struct Finish {
    Callback& cb;
    ~Finish() {
      {
        std::lock_guard<std::mutex> lk(cb.mx);
        cb.running = false;
      }
      cb.cv.notify_all();
    }
  } finish{*cb};

  auto fn = std::move(cb->fn);
  fn();
}

} // namespace pulse::rt
