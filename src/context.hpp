// SPDX-License-Identifier: BSD-3-Clause
// Copyright 2026 Joel Rosdahl

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

struct CancellationState
{
  bool cancelled = false;
  uint64_t next_id = 1;
  std::map<uint64_t, std::function<void()>> callbacks;
};

// Unregisters its callback when destroyed.
class CancellationRegistration
{
public:
  CancellationRegistration() = default;
  CancellationRegistration(std::shared_ptr<CancellationState> state, uint64_t id);
  ~CancellationRegistration();

  CancellationRegistration(const CancellationRegistration&) = delete;
  CancellationRegistration& operator=(const CancellationRegistration&) = delete;
  CancellationRegistration(CancellationRegistration&& other) noexcept;
  CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;

  void reset();

private:
  std::shared_ptr<CancellationState> _state;
  uint64_t _id = 0;
};

// Cancellation signal and optional deadline observed by a request. Contexts are cheap to copy and
// must only be used from the event loop thread.
class Context
{
public:
  using Clock = std::chrono::steady_clock;

  static Context background();

  Context with_deadline(Clock::time_point deadline) const;
  Context with_timeout(Clock::duration timeout) const;

  bool is_cancelled() const;
  bool deadline_exceeded() const;
  bool done() const { return is_cancelled() || deadline_exceeded(); }

  const std::optional<Clock::time_point>& deadline() const { return _deadline; }

  // "context canceled", "context deadline exceeded" or empty if not done.
  std::string error() const;

  // Invokes callback at once if already cancelled. Deadlines are not reported here, the owner of
  // the operation arms its own timer from deadline().
  CancellationRegistration register_callback(std::function<void()> callback) const;

private:
  friend class CancellationSource;

  std::shared_ptr<CancellationState> _state;
  std::optional<Clock::time_point> _deadline;
};

class CancellationSource
{
public:
  CancellationSource();

  void cancel();
  bool is_cancelled() const { return _state->cancelled; }

  Context context() const;

private:
  std::shared_ptr<CancellationState> _state;
};
