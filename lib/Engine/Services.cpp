//===- Services.cpp - External services consumed by the engine ------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Engine/Services.h"
#include "llvm/Support/ErrorHandling.h"

using namespace mutagen;

StringRef mutagen::getTestOutcomeName(TestOutcome outcome) {
  switch (outcome) {
  case TestOutcome::Pass:
    return "pass";
  case TestOutcome::Fail:
    return "fail";
  case TestOutcome::Threw:
    return "threw";
  }
  llvm_unreachable("unknown test outcome");
}

TraceOracle::~TraceOracle() = default;
FormLocationBridge::~FormLocationBridge() = default;
ReloadService::~ReloadService() = default;
TestExecutor::~TestExecutor() = default;
