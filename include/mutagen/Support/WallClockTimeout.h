//===- WallClockTimeout.h - Bounded test execution timer -------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// A cancellation token shared between the engine and a running test, and a
// wall-clock timer that trips the token once its bound elapses.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_SUPPORT_WALLCLOCKTIMEOUT_H
#define MUTAGEN_SUPPORT_WALLCLOCKTIMEOUT_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace mutagen {

/// Cooperative cancellation flag. Copies share the same state.
class CancellationToken {
public:
  CancellationToken();

  /// Request cancellation and wake any waiter.
  void cancel() const;

  bool isCancelled() const;

  /// Sleep for up to `duration`. Returns true if cancellation was requested
  /// before the duration elapsed.
  bool waitFor(std::chrono::milliseconds duration) const;

private:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    std::atomic<bool> cancelled{false};
  };
  std::shared_ptr<State> state;
};

/// Trips a CancellationToken (and runs an optional callback) when a
/// wall-clock bound elapses. A zero bound disables the timer.
class WallClockTimeout {
public:
  using Callback = std::function<void()>;

  WallClockTimeout(std::chrono::milliseconds timeout, CancellationToken token,
                   Callback callback = {});
  ~WallClockTimeout();

  WallClockTimeout(const WallClockTimeout &) = delete;
  WallClockTimeout &operator=(const WallClockTimeout &) = delete;

  /// Stop the timer and join the worker thread. Idempotent.
  void cancel();

  /// Return true if the bound elapsed before cancel() was called.
  bool hasFired() const { return fired.load(); }

  /// Time since construction.
  std::chrono::milliseconds elapsed() const;

private:
  void run();

  std::chrono::milliseconds timeout;
  CancellationToken token;
  Callback callback;
  std::chrono::steady_clock::time_point start;
  std::atomic<bool> stop{false};
  std::atomic<bool> fired{false};
  std::mutex mutex;
  std::condition_variable cv;
  std::thread worker;
};

} // namespace mutagen

#endif // MUTAGEN_SUPPORT_WALLCLOCKTIMEOUT_H
