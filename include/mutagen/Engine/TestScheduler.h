//===- TestScheduler.h - Bounded execution of targeted tests ----*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Runs the tests covering one site against the currently active mutant. Every
// invocation is bounded by a wall-clock timeout; once one test times out, the
// remaining tests of the site are cancelled. With more than one job the tests
// of a site run concurrently, but the whole phase completes before the call
// returns.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_ENGINE_TESTSCHEDULER_H
#define MUTAGEN_ENGINE_TESTSCHEDULER_H

#include "mutagen/Engine/Services.h"
#include "mutagen/Engine/Verdict.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace mutagen {

/// What happened to one test invocation.
struct TestRun {
  std::string testId;
  /// Set when the executor produced an outcome before any cancellation.
  std::optional<TestOutcome> outcome;
  /// The invocation exceeded its own bound.
  bool timedOut = false;
  /// The invocation was skipped or interrupted because the site finished.
  bool cancelled = false;
  /// Executor error message, if any.
  std::string error;
  std::chrono::milliseconds elapsed{0};

  /// True if this run decides the verdict of the site on its own.
  bool isDecisive() const {
    return timedOut || !error.empty() ||
           (outcome && *outcome != TestOutcome::Pass);
  }
};

/// Verdict of one site together with the individual runs.
struct ScheduleResult {
  VerdictKind verdict = VerdictKind::Pending;
  std::string detail;
  std::vector<TestRun> runs;
};

class TestScheduler {
public:
  /// A zero `timeout` disables the bound. `jobs` is clamped to at least 1.
  TestScheduler(TestExecutor &executor, std::chrono::milliseconds timeout,
                unsigned jobs = 1);

  std::chrono::milliseconds getTimeout() const { return timeout; }
  unsigned getJobs() const { return jobs; }

  /// Run `tests` with mutant `activeMutant` selected (0 for none). An empty
  /// test list yields NoCoverage without calling the executor.
  ScheduleResult runTests(ArrayRef<std::string> tests,
                          unsigned activeMutant) const;

  /// Run a single test outside of any site, e.g. to collect coverage.
  TestRun runOne(StringRef testId, unsigned activeMutant,
                 const CancellationToken &siteToken) const;

private:
  static void decide(ScheduleResult &result);

  TestExecutor &executor;
  std::chrono::milliseconds timeout;
  unsigned jobs;
};

} // namespace mutagen

#endif // MUTAGEN_ENGINE_TESTSCHEDULER_H
