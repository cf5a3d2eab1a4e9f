//===- Diagnostics.cpp - Severity-tagged diagnostic sink ------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Support/Diagnostics.h"
#include "llvm/ADT/Twine.h"
#include <atomic>
#include <mutex>

using namespace mutagen;

namespace {

struct DiagnosticState {
  std::mutex mutex;
  DiagnosticHandler handler;
  DiagSeverity threshold = DiagSeverity::Note;
  std::atomic<unsigned> numErrors{0};
  std::atomic<unsigned> numWarnings{0};
};

DiagnosticState &getState() {
  static DiagnosticState state;
  return state;
}

/// Lower rank is more severe.
unsigned getRank(DiagSeverity severity) {
  switch (severity) {
  case DiagSeverity::Error:
    return 0;
  case DiagSeverity::Warning:
    return 1;
  case DiagSeverity::Note:
    return 2;
  case DiagSeverity::Remark:
    return 3;
  }
  return 3;
}

void emitWith(DiagSeverity severity, const Twine &message, StringRef file,
              unsigned line) {
  Diagnostic diag;
  diag.severity = severity;
  diag.message = message.str();
  diag.file = file.str();
  diag.line = line;
  emitDiagnostic(std::move(diag));
}

} // namespace

StringRef mutagen::getSeverityString(DiagSeverity severity) {
  switch (severity) {
  case DiagSeverity::Error:
    return "error";
  case DiagSeverity::Warning:
    return "warning";
  case DiagSeverity::Note:
    return "note";
  case DiagSeverity::Remark:
    return "remark";
  }
  return "unknown";
}

std::optional<DiagSeverity> mutagen::parseSeverity(StringRef name) {
  if (name == "error")
    return DiagSeverity::Error;
  if (name == "warning")
    return DiagSeverity::Warning;
  if (name == "note")
    return DiagSeverity::Note;
  if (name == "remark")
    return DiagSeverity::Remark;
  return std::nullopt;
}

void Diagnostic::print(llvm::raw_ostream &os) const {
  os << "mutagen: " << getSeverityString(severity) << ": ";
  if (!file.empty()) {
    os << file;
    if (line)
      os << ":" << line;
    os << ": ";
  }
  os << message << "\n";
}

void mutagen::emitDiagnostic(Diagnostic diag) {
  auto &state = getState();
  if (diag.severity == DiagSeverity::Error)
    ++state.numErrors;
  else if (diag.severity == DiagSeverity::Warning)
    ++state.numWarnings;

  std::lock_guard<std::mutex> lock(state.mutex);
  if (getRank(diag.severity) > getRank(state.threshold))
    return;
  if (state.handler) {
    state.handler(diag);
    return;
  }
  diag.print(llvm::errs());
}

void mutagen::emitError(const Twine &message, StringRef file, unsigned line) {
  emitWith(DiagSeverity::Error, message, file, line);
}

void mutagen::emitWarning(const Twine &message, StringRef file,
                          unsigned line) {
  emitWith(DiagSeverity::Warning, message, file, line);
}

void mutagen::emitNote(const Twine &message, StringRef file, unsigned line) {
  emitWith(DiagSeverity::Note, message, file, line);
}

void mutagen::emitRemark(const Twine &message, StringRef file, unsigned line) {
  emitWith(DiagSeverity::Remark, message, file, line);
}

void mutagen::setDiagnosticThreshold(DiagSeverity threshold) {
  auto &state = getState();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.threshold = threshold;
}

DiagSeverity mutagen::getDiagnosticThreshold() {
  auto &state = getState();
  std::lock_guard<std::mutex> lock(state.mutex);
  return state.threshold;
}

unsigned mutagen::getNumErrorsEmitted() { return getState().numErrors.load(); }

unsigned mutagen::getNumWarningsEmitted() {
  return getState().numWarnings.load();
}

void mutagen::resetDiagnosticCounts() {
  getState().numErrors.store(0);
  getState().numWarnings.store(0);
}

ScopedDiagnosticHandler::ScopedDiagnosticHandler(DiagnosticHandler handler) {
  auto &state = getState();
  std::lock_guard<std::mutex> lock(state.mutex);
  previous = std::move(state.handler);
  state.handler = std::move(handler);
}

ScopedDiagnosticHandler::~ScopedDiagnosticHandler() {
  auto &state = getState();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.handler = std::move(previous);
}
