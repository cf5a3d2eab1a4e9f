//===- ProcessServices.cpp - Engine services backed by processes ----------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "ProcessServices.h"
#include "mutagen/Support/Diagnostics.h"
#include "mutagen/Support/MutagenError.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Program.h"
#include <chrono>
#include <thread>

#define DEBUG_TYPE "mutagen-process"

extern char **environ;

using namespace mutagen;
using namespace mutagen::tool;
using llvm::StringRef;

//===----------------------------------------------------------------------===//
// Command
//===----------------------------------------------------------------------===//

llvm::Expected<Command> Command::parse(StringRef text) {
  llvm::SmallVector<StringRef, 8> words;
  text.split(words, ' ', /*MaxSplit=*/-1, /*KeepEmpty=*/false);
  if (words.empty())
    return makeError(ErrorKind::ConfigError, "empty command");

  Command command;
  StringRef program = words.front();
  if (program.contains('/')) {
    if (!llvm::sys::fs::can_execute(program))
      return makeError(ErrorKind::ConfigError,
                       "'" + program + "' is not executable");
    command.program = program.str();
  } else {
    llvm::ErrorOr<std::string> found = llvm::sys::findProgramByName(program);
    if (!found)
      return makeError(ErrorKind::ConfigError,
                       "'" + program + "' not found in PATH");
    command.program = *found;
  }
  for (StringRef word : llvm::ArrayRef<StringRef>(words).drop_front())
    command.args.push_back(word.str());
  return command;
}

/// Run `command` followed by `extraArgs` and return its exit code. The child
/// is killed when `token` trips first, in which case `std::nullopt` is
/// returned.
static llvm::Expected<std::optional<int>>
runCommand(const Command &command, llvm::ArrayRef<std::string> extraArgs,
           llvm::Optional<llvm::ArrayRef<StringRef>> env,
           const CancellationToken *token) {
  llvm::SmallVector<StringRef, 16> argv;
  argv.push_back(command.program);
  for (const std::string &arg : command.args)
    argv.push_back(arg);
  for (const std::string &arg : extraArgs)
    argv.push_back(arg);

  // Keep stderr for diagnostics from the program under test.
  llvm::Optional<StringRef> redirects[] = {StringRef(""), StringRef(""),
                                          llvm::None};
  std::string errMsg;
  bool executionFailed = false;
  llvm::sys::ProcessInfo child = llvm::sys::ExecuteNoWait(
      command.program, argv, env, redirects, /*MemoryLimit=*/0, &errMsg,
      &executionFailed);
  if (executionFailed)
    return makeError(ErrorKind::TestError,
                     "could not run '" + command.program + "': " + errMsg);

  while (true) {
    llvm::sys::ProcessInfo status =
        llvm::sys::Wait(child, /*SecondsToWait=*/0, &errMsg);
    if (status.Pid != 0) {
      if (status.ReturnCode == -1)
        return makeError(ErrorKind::TestError,
                         "waiting for '" + command.program +
                             "' failed: " + errMsg);
      return std::optional<int>(status.ReturnCode);
    }
    if (token && token->waitFor(std::chrono::milliseconds(10))) {
      // A non-zero wait kills the child once it expires.
      llvm::sys::Wait(child, /*SecondsToWait=*/1, &errMsg);
      return std::optional<int>();
    }
    if (!token)
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

//===----------------------------------------------------------------------===//
// ProcessTestExecutor
//===----------------------------------------------------------------------===//

llvm::Expected<TestOutcome>
ProcessTestExecutor::run(StringRef testId, const TestInvocation &invocation) {
  std::vector<std::string> environment;
  for (char **entry = environ; *entry; ++entry) {
    StringRef variable(*entry);
    if (!variable.startswith((kActiveMutantVar + "=").str()))
      environment.push_back(variable.str());
  }
  environment.push_back(
      (kActiveMutantVar + "=" + llvm::Twine(invocation.activeMutant)).str());
  llvm::SmallVector<StringRef, 64> env(environment.begin(), environment.end());

  LLVM_DEBUG(llvm::dbgs() << "running " << testId << " with mutant "
                          << invocation.activeMutant << "\n");
  auto exitCode =
      runCommand(command, {testId.str()}, llvm::ArrayRef<StringRef>(env),
                 &invocation.token);
  if (!exitCode)
    return exitCode.takeError();
  if (!*exitCode)
    return makeError(ErrorKind::TestTimeout,
                     "'" + testId + "' was interrupted");
  switch (**exitCode) {
  case 0:
    return TestOutcome::Pass;
  case 1:
    return TestOutcome::Fail;
  default:
    return TestOutcome::Threw;
  }
}

//===----------------------------------------------------------------------===//
// CommandReloadService
//===----------------------------------------------------------------------===//

llvm::Error CommandReloadService::reload(llvm::ArrayRef<std::string> files) {
  if (!command)
    return llvm::Error::success();
  auto exitCode = runCommand(*command, files, llvm::None, nullptr);
  if (!exitCode)
    return exitCode.takeError();
  if (**exitCode != 0)
    return llvm::createStringError(std::errc::invalid_argument,
                                   "reload command exited with %d",
                                   **exitCode);
  return llvm::Error::success();
}

//===----------------------------------------------------------------------===//
// JSON-lines files
//===----------------------------------------------------------------------===//

/// Non-empty lines of `path`. A missing file has none.
static std::vector<std::string> readLines(StringRef path) {
  std::vector<std::string> lines;
  auto buffer = llvm::MemoryBuffer::getFile(path);
  if (!buffer)
    return lines;
  llvm::SmallVector<StringRef, 64> parts;
  (*buffer)->getBuffer().split(parts, '\n', /*MaxSplit=*/-1,
                               /*KeepEmpty=*/false);
  for (StringRef part : parts)
    if (!part.trim().empty())
      lines.push_back(part.trim().str());
  return lines;
}

static llvm::Expected<TraceEvent> parseTraceEvent(StringRef line) {
  auto json = llvm::json::parse(line);
  if (!json)
    return json.takeError();
  const llvm::json::Object *object = json->getAsObject();
  if (!object)
    return makeError(ErrorKind::ParseError, "expected an object");
  auto test = object->getString("test");
  auto form = object->getString("form");
  auto coord = object->getString("coord");
  if (!test || !form || !coord)
    return makeError(ErrorKind::ParseError,
                     "expected 'test', 'form' and 'coord' strings");
  auto coordinate = Coordinate::parse(*coord);
  if (!coordinate)
    return coordinate.takeError();
  return TraceEvent{test->str(), form->str(), std::move(*coordinate)};
}

void TraceFileOracle::reset() {
  if (std::error_code ec = llvm::sys::fs::remove(path))
    emitWarning("could not clear trace file '" + path + "': " + ec.message());
}

std::vector<TraceEvent> TraceFileOracle::drain() {
  std::vector<TraceEvent> events;
  unsigned lineNo = 0;
  for (const std::string &line : readLines(path)) {
    ++lineNo;
    auto event = parseTraceEvent(line);
    if (!event) {
      emitWarning("ignoring malformed trace event: " +
                      llvm::toString(event.takeError()),
                  path, lineNo);
      continue;
    }
    events.push_back(std::move(*event));
  }
  reset();
  return events;
}

std::vector<FormAnchor> BridgeFile::getAnchors() {
  std::vector<FormAnchor> anchors;
  unsigned lineNo = 0;
  for (const std::string &line : readLines(path)) {
    ++lineNo;
    auto anchor = llvm::json::parse<FormAnchor>(line);
    if (!anchor) {
      emitWarning("ignoring malformed bridge entry: " +
                      llvm::toString(anchor.takeError()),
                  path, lineNo);
      continue;
    }
    if (!root.empty() && llvm::sys::path::is_relative(anchor->file)) {
      llvm::SmallString<256> resolved(root);
      llvm::sys::path::append(resolved, anchor->file);
      llvm::sys::path::remove_dots(resolved, /*remove_dot_dot=*/true);
      anchor->file = std::string(resolved);
    }
    anchors.push_back(std::move(*anchor));
  }
  return anchors;
}

std::optional<FormAnchor> BridgeFile::locate(StringRef formId) {
  // Later entries win; a reload appends the new position of a form.
  std::optional<FormAnchor> result;
  for (FormAnchor &anchor : getAnchors())
    if (anchor.formId == formId)
      result = std::move(anchor);
  return result;
}
