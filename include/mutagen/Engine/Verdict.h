//===- Verdict.h - Per-site verdict state machine ---------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// A site starts out pending and moves to exactly one terminal verdict:
//
//   pending -> killed       at least one targeted test failed or threw
//   pending -> survived     every targeted test passed
//   pending -> no-coverage  no test covers the site; nothing was executed
//   pending -> timeout      a targeted test exceeded its bound
//   pending -> error        execution itself failed
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_ENGINE_VERDICT_H
#define MUTAGEN_ENGINE_VERDICT_H

#include "mutagen/Support/LLVM.h"
#include "llvm/Support/Error.h"
#include <optional>
#include <string>

namespace mutagen {

enum class VerdictKind {
  Pending,
  Killed,
  Survived,
  NoCoverage,
  Timeout,
  Error,
};

/// "pending", "killed", "survived", "no-coverage", "timeout" or "error".
StringRef getVerdictName(VerdictKind kind);
std::optional<VerdictKind> parseVerdictName(StringRef name);

class Verdict {
public:
  Verdict() = default;

  VerdictKind getKind() const { return kind; }
  bool isTerminal() const { return kind != VerdictKind::Pending; }

  /// Free-form explanation of the verdict, e.g. the killing test.
  StringRef getDetail() const { return detail; }

  /// Move to the terminal state `to`. Fails with StateError if the verdict is
  /// already terminal or `to` is Pending.
  llvm::Error transition(VerdictKind to, StringRef detail = "");

private:
  VerdictKind kind = VerdictKind::Pending;
  std::string detail;
};

} // namespace mutagen

#endif // MUTAGEN_ENGINE_VERDICT_H
