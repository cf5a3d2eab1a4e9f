//===- WallClockTimeout.cpp - Bounded test execution timer ----*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Support/WallClockTimeout.h"

using namespace mutagen;

CancellationToken::CancellationToken() : state(std::make_shared<State>()) {}

void CancellationToken::cancel() const {
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->cancelled.store(true);
  }
  state->cv.notify_all();
}

bool CancellationToken::isCancelled() const { return state->cancelled.load(); }

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
  std::unique_lock<std::mutex> lock(state->mutex);
  return state->cv.wait_for(lock, duration,
                            [this]() { return state->cancelled.load(); });
}

WallClockTimeout::WallClockTimeout(std::chrono::milliseconds timeout,
                                   CancellationToken token, Callback callback)
    : timeout(timeout), token(std::move(token)), callback(std::move(callback)),
      start(std::chrono::steady_clock::now()) {
  if (timeout.count() == 0)
    return;
  worker = std::thread([this]() { run(); });
}

WallClockTimeout::~WallClockTimeout() { cancel(); }

void WallClockTimeout::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    stop.store(true);
  }
  cv.notify_all();
  if (worker.joinable())
    worker.join();
}

std::chrono::milliseconds WallClockTimeout::elapsed() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
}

void WallClockTimeout::run() {
  std::unique_lock<std::mutex> lock(mutex);
  if (cv.wait_until(lock, start + timeout, [this]() { return stop.load(); }))
    return;
  fired.store(true);
  lock.unlock();
  token.cancel();
  if (callback)
    callback();
}
