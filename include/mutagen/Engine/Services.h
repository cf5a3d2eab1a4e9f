//===- Services.h - External services consumed by the engine ----*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// The engine never evaluates code itself. It drives a live program through
// four services: a trace oracle reporting which syntax locations a test
// evaluated, a bridge naming where the oracle's forms start, a reload service
// that replaces definitions after a file changed, and a test executor.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_ENGINE_SERVICES_H
#define MUTAGEN_ENGINE_SERVICES_H

#include "mutagen/Coverage/CoverageIndex.h"
#include "mutagen/Coverage/FormLocator.h"
#include "mutagen/Support/LLVM.h"
#include "mutagen/Support/WallClockTimeout.h"
#include "llvm/Support/Error.h"
#include <optional>
#include <string>
#include <vector>

namespace mutagen {

/// Result of one test invocation. A thrown exception is a failure of the
/// test, not an infrastructure error.
enum class TestOutcome { Pass, Fail, Threw };

StringRef getTestOutcomeName(TestOutcome outcome);

/// Per-invocation context handed to the executor.
struct TestInvocation {
  /// Schemata mutant to activate, 0 for none.
  unsigned activeMutant = 0;
  /// Tripped when the invocation exceeds its bound or the site is done.
  CancellationToken token;
};

class TraceOracle {
public:
  virtual ~TraceOracle();

  /// Forget every event recorded so far.
  virtual void reset() = 0;

  /// Return and forget the events recorded since the last reset or drain.
  virtual std::vector<TraceEvent> drain() = 0;
};

class FormLocationBridge {
public:
  virtual ~FormLocationBridge();

  /// Where the oracle form `formId` starts.
  virtual std::optional<FormAnchor> locate(StringRef formId) = 0;

  /// Every form currently known to the program.
  virtual std::vector<FormAnchor> getAnchors() = 0;
};

class ReloadService {
public:
  virtual ~ReloadService();

  /// Replace the definitions of `files` and everything depending on them.
  virtual llvm::Error reload(ArrayRef<std::string> files) = 0;
};

class TestExecutor {
public:
  virtual ~TestExecutor();

  /// Run one test. An error means the test could not be executed at all.
  /// Implementations should return promptly once `invocation.token` is
  /// cancelled.
  virtual llvm::Expected<TestOutcome>
  run(StringRef testId, const TestInvocation &invocation) = 0;
};

/// The services one run needs, all owned by the caller.
struct EngineServices {
  TraceOracle &oracle;
  FormLocationBridge &bridge;
  ReloadService &reloader;
  TestExecutor &executor;
};

} // namespace mutagen

#endif // MUTAGEN_ENGINE_SERVICES_H
