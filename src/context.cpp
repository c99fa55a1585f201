// SPDX-License-Identifier: BSD-3-Clause
// Copyright 2026 Joel Rosdahl

#include "context.hpp"

#include <utility>
#include <vector>

CancellationRegistration::CancellationRegistration(std::shared_ptr<CancellationState> state,
                                                   uint64_t id)
  : _state(std::move(state)),
    _id(id)
{
}

CancellationRegistration::~CancellationRegistration()
{
  reset();
}

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
  : _state(std::move(other._state)),
    _id(std::exchange(other._id, 0))
{
}

CancellationRegistration&
CancellationRegistration::operator=(CancellationRegistration&& other) noexcept
{
  if (this != &other) {
    reset();
    _state = std::move(other._state);
    _id = std::exchange(other._id, 0);
  }
  return *this;
}

void CancellationRegistration::reset()
{
  if (_state && _id != 0) {
    _state->callbacks.erase(_id);
  }
  _state.reset();
  _id = 0;
}

Context Context::background()
{
  return Context();
}

Context Context::with_deadline(Clock::time_point deadline) const
{
  Context derived = *this;
  if (!derived._deadline || deadline < *derived._deadline) {
    derived._deadline = deadline;
  }
  return derived;
}

Context Context::with_timeout(Clock::duration timeout) const
{
  return with_deadline(Clock::now() + timeout);
}

bool Context::is_cancelled() const
{
  return _state && _state->cancelled;
}

bool Context::deadline_exceeded() const
{
  return _deadline && Clock::now() >= *_deadline;
}

std::string Context::error() const
{
  if (is_cancelled()) {
    return "context canceled";
  }
  if (deadline_exceeded()) {
    return "context deadline exceeded";
  }
  return {};
}

CancellationRegistration Context::register_callback(std::function<void()> callback) const
{
  if (!_state) {
    return {};
  }
  if (_state->cancelled) {
    callback();
    return {};
  }

  uint64_t id = _state->next_id++;
  _state->callbacks.emplace(id, std::move(callback));
  return CancellationRegistration(_state, id);
}

CancellationSource::CancellationSource()
  : _state(std::make_shared<CancellationState>())
{
}

void CancellationSource::cancel()
{
  if (_state->cancelled) {
    return;
  }
  _state->cancelled = true;

  std::vector<uint64_t> ids;
  for (const auto& pair : _state->callbacks) {
    ids.push_back(pair.first);
  }

  // A callback may unregister others, so look each one up again.
  for (uint64_t id : ids) {
    auto it = _state->callbacks.find(id);
    if (it == _state->callbacks.end()) {
      continue;
    }
    auto callback = std::move(it->second);
    _state->callbacks.erase(it);
    callback();
  }
}

Context CancellationSource::context() const
{
  Context context;
  context._state = _state;
  return context;
}
