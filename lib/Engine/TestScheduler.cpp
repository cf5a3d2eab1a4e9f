//===- TestScheduler.cpp - Bounded execution of targeted tests ------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Engine/TestScheduler.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Debug.h"
#include <algorithm>
#include <atomic>
#include <thread>

#define DEBUG_TYPE "mutagen-scheduler"

using namespace mutagen;

TestScheduler::TestScheduler(TestExecutor &executor,
                             std::chrono::milliseconds timeout, unsigned jobs)
    : executor(executor), timeout(timeout), jobs(std::max(jobs, 1u)) {}

TestRun TestScheduler::runOne(StringRef testId, unsigned activeMutant,
                              const CancellationToken &siteToken) const {
  TestRun run;
  run.testId = testId.str();
  if (siteToken.isCancelled()) {
    run.cancelled = true;
    return run;
  }

  WallClockTimeout timer(timeout, siteToken);
  TestInvocation invocation;
  invocation.activeMutant = activeMutant;
  invocation.token = siteToken;
  llvm::Expected<TestOutcome> outcome = executor.run(testId, invocation);
  timer.cancel();
  run.elapsed = timer.elapsed();

  if (timer.hasFired()) {
    run.timedOut = true;
    if (!outcome)
      LLVM_DEBUG(llvm::dbgs() << testId << " timed out: "
                              << llvm::toString(outcome.takeError()) << "\n");
    else
      LLVM_DEBUG(llvm::dbgs() << testId << " timed out\n");
    return run;
  }
  if (!outcome) {
    std::string message = llvm::toString(outcome.takeError());
    // An error caused by another test cancelling the site is not a finding.
    if (siteToken.isCancelled())
      run.cancelled = true;
    else
      run.error = std::move(message);
    return run;
  }
  if (siteToken.isCancelled() && *outcome == TestOutcome::Pass) {
    run.cancelled = true;
    return run;
  }
  run.outcome = *outcome;
  return run;
}

void TestScheduler::decide(ScheduleResult &result) {
  for (const TestRun &run : result.runs) {
    if (!run.isDecisive())
      continue;
    if (run.timedOut) {
      result.verdict = VerdictKind::Timeout;
      result.detail = run.testId + " exceeded its time bound";
    } else if (!run.error.empty()) {
      result.verdict = VerdictKind::Error;
      result.detail = run.testId + ": " + run.error;
    } else {
      result.verdict = VerdictKind::Killed;
      result.detail = (*run.outcome == TestOutcome::Threw ? "thrown in "
                                                           : "failed ") +
                      run.testId;
    }
    return;
  }
  result.verdict = VerdictKind::Survived;
  result.detail = "all " + std::to_string(result.runs.size()) +
                  " covering tests passed";
}

ScheduleResult TestScheduler::runTests(ArrayRef<std::string> tests,
                                       unsigned activeMutant) const {
  ScheduleResult result;
  if (tests.empty()) {
    result.verdict = VerdictKind::NoCoverage;
    result.detail = "no covering tests";
    return result;
  }

  CancellationToken siteToken;
  if (jobs == 1 || tests.size() == 1) {
    for (const std::string &test : tests) {
      result.runs.push_back(runOne(test, activeMutant, siteToken));
      if (result.runs.back().isDecisive())
        break;
    }
    decide(result);
    return result;
  }

  result.runs.resize(tests.size());
  std::atomic<size_t> next{0};
  auto worker = [&]() {
    for (size_t i = next++; i < tests.size(); i = next++) {
      result.runs[i] = runOne(tests[i], activeMutant, siteToken);
      // The site is decided; stop the others.
      if (result.runs[i].isDecisive())
        siteToken.cancel();
    }
  };

  std::vector<std::thread> threads;
  unsigned numThreads = std::min<size_t>(jobs, tests.size());
  for (unsigned i = 0; i < numThreads; ++i)
    threads.emplace_back(worker);
  for (auto &thread : threads)
    if (thread.joinable())
      thread.join();

  decide(result);
  LLVM_DEBUG(llvm::dbgs() << "mutant " << activeMutant << ": "
                          << getVerdictName(result.verdict) << " after "
                          << tests.size() << " tests on " << numThreads
                          << " threads\n");
  return result;
}
