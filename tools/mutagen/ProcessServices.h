//===- ProcessServices.h - Engine services backed by processes --*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Adapters that connect the engine to an external program. Tests run as child
// processes, coverage arrives through a JSON-lines trace file, and the form
// bridge is a JSON-lines side file written by the instrumented program.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_TOOLS_MUTAGEN_PROCESSSERVICES_H
#define MUTAGEN_TOOLS_MUTAGEN_PROCESSSERVICES_H

#include "mutagen/Engine/Services.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include <optional>
#include <string>
#include <vector>

namespace mutagen::tool {

/// Environment variable naming the schemata mutant a test process activates.
constexpr llvm::StringLiteral kActiveMutantVar = "MUTAGEN_ACTIVE_MUTANT";

/// A command line split into a resolved program and its leading arguments.
struct Command {
  std::string program;
  std::vector<std::string> args;

  /// Split `text` on whitespace and resolve the program through PATH.
  static llvm::Expected<Command> parse(llvm::StringRef text);
};

/// Runs `<command> <testId>`. Exit code 0 is a pass, 1 a failure, and
/// anything else (including a crash) a thrown test.
class ProcessTestExecutor : public TestExecutor {
public:
  explicit ProcessTestExecutor(Command command) : command(std::move(command)) {}

  llvm::Expected<TestOutcome> run(llvm::StringRef testId,
                                  const TestInvocation &invocation) override;

private:
  Command command;
};

/// Runs `<command> <file>...` after files change. Without a command every
/// test process loads the program afresh and reloading is a no-op.
class CommandReloadService : public ReloadService {
public:
  explicit CommandReloadService(std::optional<Command> command)
      : command(std::move(command)) {}

  llvm::Error reload(llvm::ArrayRef<std::string> files) override;

private:
  std::optional<Command> command;
};

/// Reads `{"test": ..., "form": ..., "coord": ...}` lines appended by the
/// instrumented program.
class TraceFileOracle : public TraceOracle {
public:
  explicit TraceFileOracle(std::string path) : path(std::move(path)) {}

  void reset() override;
  std::vector<TraceEvent> drain() override;

private:
  std::string path;
};

/// Reads `{"form": ..., "file": ..., "line": ...}` lines. The file is read
/// on every query since reloads rewrite it. Relative source files are
/// resolved against `root`.
class BridgeFile : public FormLocationBridge {
public:
  BridgeFile(std::string path, std::string root)
      : path(std::move(path)), root(std::move(root)) {}

  std::optional<FormAnchor> locate(llvm::StringRef formId) override;
  std::vector<FormAnchor> getAnchors() override;

private:
  std::string path;
  std::string root;
};

} // namespace mutagen::tool

#endif // MUTAGEN_TOOLS_MUTAGEN_PROCESSSERVICES_H
