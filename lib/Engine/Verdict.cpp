//===- Verdict.cpp - Per-site verdict state machine -----------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Engine/Verdict.h"
#include "mutagen/Support/MutagenError.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/ErrorHandling.h"

using namespace mutagen;

StringRef mutagen::getVerdictName(VerdictKind kind) {
  switch (kind) {
  case VerdictKind::Pending:
    return "pending";
  case VerdictKind::Killed:
    return "killed";
  case VerdictKind::Survived:
    return "survived";
  case VerdictKind::NoCoverage:
    return "no-coverage";
  case VerdictKind::Timeout:
    return "timeout";
  case VerdictKind::Error:
    return "error";
  }
  llvm_unreachable("unknown verdict kind");
}

std::optional<VerdictKind> mutagen::parseVerdictName(StringRef name) {
  return llvm::StringSwitch<std::optional<VerdictKind>>(name)
      .Case("pending", VerdictKind::Pending)
      .Case("killed", VerdictKind::Killed)
      .Case("survived", VerdictKind::Survived)
      .Case("no-coverage", VerdictKind::NoCoverage)
      .Case("timeout", VerdictKind::Timeout)
      .Case("error", VerdictKind::Error)
      .Default(std::nullopt);
}

llvm::Error Verdict::transition(VerdictKind to, StringRef newDetail) {
  if (to == VerdictKind::Pending)
    return makeError(ErrorKind::StateError,
                     "a verdict cannot move back to pending");
  if (isTerminal())
    return makeError(ErrorKind::StateError,
                     "verdict is already " + getVerdictName(kind) +
                         "; cannot become " + getVerdictName(to));
  kind = to;
  detail = newDetail.str();
  return llvm::Error::success();
}
