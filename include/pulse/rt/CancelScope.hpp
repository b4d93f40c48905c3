// File: include/pulse/rt/CancelScope.hpp
#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace pulse::rt {

// Copyable handle to a node in a cancellation tree.
// - cancel() is one-shot and idempotent; it never resets.
// - Cancelling a scope cancels every live child derived from it.
// - A default-constructed handle is empty (no state); withParent() and the
//   query/cancel members reject it.
class CancelScope {
  struct State;
  struct Callback;

public:
  // RAII hook returned by onCancel(). Destroying (or reset()ing) it removes
  // the callback; if the callback is running on another thread at that
  // moment, the destructor waits for it to return.
  class Registration {
  public:
    Registration() = default;
    ~Registration();

    Registration(Registration&& other) noexcept;
    Registration& operator=(Registration&& other) noexcept;
    Registration(const Registration&)            = delete;
    Registration& operator=(const Registration&) = delete;

    void reset();

  private:
    friend class CancelScope;
    Registration(const std::shared_ptr<State>& state, std::shared_ptr<Callback> cb);

    std::weak_ptr<State>      state_;
    std::shared_ptr<Callback> cb_;
  };

  CancelScope() = default;

  // Fresh root; only cancelled when a holder calls cancel() on it.
  static CancelScope background();

  // Child of parent. Throws std::invalid_argument on an empty parent handle.
  // The child is born cancelled when the parent already is.
  static CancelScope withParent(const CancelScope& parent);

  bool valid() const noexcept { return state_ != nullptr; }
  explicit operator bool() const noexcept { return valid(); }

  void cancel() const;
  bool cancelled() const;

  // Runs fn once when the scope is cancelled (inline when it already is).
  // fn runs on the cancelling thread and must not block on this scope.
  Registration onCancel(std::function<void()> fn) const;

  void waitCancelled() const;
  bool waitCancelledFor(std::chrono::nanoseconds timeout) const;

private:
  explicit CancelScope(std::shared_ptr<State> state) : state_(std::move(state)) {}

  const std::shared_ptr<State>& require() const;
  static void cancelState(const std::shared_ptr<State>& state);
  static void invoke(const std::shared_ptr<Callback>& cb);

  std::shared_ptr<State> state_;
};

} // namespace pulse::rt
