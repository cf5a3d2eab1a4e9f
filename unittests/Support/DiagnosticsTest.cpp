//===- DiagnosticsTest.cpp - Diagnostic sink tests --------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Support/Diagnostics.h"
#include "gtest/gtest.h"
#include <vector>

using namespace mutagen;

namespace {

//===----------------------------------------------------------------------===//
// Severity Tests
//===----------------------------------------------------------------------===//

TEST(DiagSeverityTest, NamesRoundTrip) {
  for (auto severity : {DiagSeverity::Error, DiagSeverity::Warning,
                        DiagSeverity::Note, DiagSeverity::Remark}) {
    auto parsed = parseSeverity(getSeverityString(severity));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, severity);
  }
  EXPECT_FALSE(parseSeverity("fatal").has_value());
}

//===----------------------------------------------------------------------===//
// Diagnostic Tests
//===----------------------------------------------------------------------===//

TEST(DiagnosticTest, PrintWithLocation) {
  Diagnostic diag;
  diag.severity = DiagSeverity::Warning;
  diag.message = "ambiguous coordinate";
  diag.file = "src/demo/core.clj";
  diag.line = 12;

  std::string out;
  llvm::raw_string_ostream os(out);
  diag.print(os);
  os.flush();
  EXPECT_EQ(out,
            "mutagen: warning: src/demo/core.clj:12: ambiguous coordinate\n");
}

TEST(DiagnosticTest, PrintWithoutLocation) {
  Diagnostic diag;
  diag.severity = DiagSeverity::Error;
  diag.message = "revert failed";

  std::string out;
  llvm::raw_string_ostream os(out);
  diag.print(os);
  os.flush();
  EXPECT_EQ(out, "mutagen: error: revert failed\n");
}

//===----------------------------------------------------------------------===//
// Handler Tests
//===----------------------------------------------------------------------===//

TEST(DiagnosticHandlerTest, ScopedHandlerCapturesAndRestores) {
  std::vector<Diagnostic> outer, inner;
  ScopedDiagnosticHandler outerHandler(
      [&](const Diagnostic &diag) { outer.push_back(diag); });
  {
    ScopedDiagnosticHandler innerHandler(
        [&](const Diagnostic &diag) { inner.push_back(diag); });
    emitWarning("stale backup restored", "a.clj", 3);
  }
  emitNote("done");

  ASSERT_EQ(inner.size(), 1u);
  EXPECT_EQ(inner[0].severity, DiagSeverity::Warning);
  EXPECT_EQ(inner[0].message, "stale backup restored");
  EXPECT_EQ(inner[0].file, "a.clj");
  EXPECT_EQ(inner[0].line, 3u);
  ASSERT_EQ(outer.size(), 1u);
  EXPECT_EQ(outer[0].message, "done");
}

TEST(DiagnosticHandlerTest, ThresholdFiltersLessSevere) {
  std::vector<Diagnostic> diags;
  ScopedDiagnosticHandler handler(
      [&](const Diagnostic &diag) { diags.push_back(diag); });
  DiagSeverity previous = getDiagnosticThreshold();
  setDiagnosticThreshold(DiagSeverity::Warning);

  emitRemark("hidden");
  emitNote("hidden too");
  emitWarning("shown");
  emitError("shown too");
  setDiagnosticThreshold(previous);

  ASSERT_EQ(diags.size(), 2u);
  EXPECT_EQ(diags[0].message, "shown");
  EXPECT_EQ(diags[1].severity, DiagSeverity::Error);
}

TEST(DiagnosticHandlerTest, CountsErrorsAndWarnings) {
  ScopedDiagnosticHandler handler([](const Diagnostic &) {});
  resetDiagnosticCounts();
  emitWarning("w1");
  emitWarning("w2");
  emitError("e1");
  emitNote("n1");
  EXPECT_EQ(getNumWarningsEmitted(), 2u);
  EXPECT_EQ(getNumErrorsEmitted(), 1u);
  resetDiagnosticCounts();
  EXPECT_EQ(getNumWarningsEmitted(), 0u);
}

} // namespace
