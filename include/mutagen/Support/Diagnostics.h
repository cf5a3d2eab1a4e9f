//===- Diagnostics.h - Severity-tagged diagnostic sink ----------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// User-facing warnings and errors emitted by the engine libraries. Debug
// tracing uses LLVM_DEBUG instead; this sink is for messages a user of the
// driver is expected to read.
//
// Example output format:
//   mutagen: warning: src/demo/core.clj:12: ambiguous coordinate '3/#0f..'
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_SUPPORT_DIAGNOSTICS_H
#define MUTAGEN_SUPPORT_DIAGNOSTICS_H

#include "mutagen/Support/LLVM.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/raw_ostream.h"
#include <functional>
#include <optional>
#include <string>

namespace mutagen {

/// Severity levels for diagnostics.
enum class DiagSeverity { Error, Warning, Note, Remark };

/// Return the lowercase name of a severity ("error", "warning", ...).
StringRef getSeverityString(DiagSeverity severity);

/// Parse a severity name. Accepts the names produced by getSeverityString.
std::optional<DiagSeverity> parseSeverity(StringRef name);

/// A single emitted diagnostic.
struct Diagnostic {
  DiagSeverity severity = DiagSeverity::Note;
  std::string message;
  /// Optional source file the diagnostic refers to.
  std::string file;
  /// 1-based line, 0 when unknown.
  unsigned line = 0;

  /// Print in the plain "mutagen: <severity>: <file>:<line>: <message>" form.
  void print(llvm::raw_ostream &os) const;
};

using DiagnosticHandler = std::function<void(const Diagnostic &)>;

/// Emit a diagnostic through the current handler. Diagnostics less severe
/// than the current threshold are dropped.
void emitDiagnostic(Diagnostic diag);

void emitError(const Twine &message, StringRef file = "", unsigned line = 0);
void emitWarning(const Twine &message, StringRef file = "", unsigned line = 0);
void emitNote(const Twine &message, StringRef file = "", unsigned line = 0);
void emitRemark(const Twine &message, StringRef file = "", unsigned line = 0);

/// Set the least severe level that is still emitted. Defaults to Note.
void setDiagnosticThreshold(DiagSeverity threshold);
DiagSeverity getDiagnosticThreshold();

/// Number of errors and warnings emitted since the last reset.
unsigned getNumErrorsEmitted();
unsigned getNumWarningsEmitted();
void resetDiagnosticCounts();

/// Temporarily routes all diagnostics to a custom handler. The previous
/// handler is restored when the object goes out of scope.
class ScopedDiagnosticHandler {
public:
  explicit ScopedDiagnosticHandler(DiagnosticHandler handler);
  ~ScopedDiagnosticHandler();

  ScopedDiagnosticHandler(const ScopedDiagnosticHandler &) = delete;
  ScopedDiagnosticHandler &operator=(const ScopedDiagnosticHandler &) = delete;

private:
  DiagnosticHandler previous;
};

} // namespace mutagen

#endif // MUTAGEN_SUPPORT_DIAGNOSTICS_H
