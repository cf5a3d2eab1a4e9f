//===- FormLocator.h - (file, line) to form id resolution -------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// The trace oracle names forms in its own identifier space, while mutation
// sites are discovered by static scanning and located by file and line. The
// FormLocator reconciles the two: given the oracle's (form id -> file, start
// line) bridge entries, a (file, line) query resolves to the form whose start
// line is the greatest value not exceeding the queried line.
//
// Several forms starting on the same line cannot be told apart; the first one
// registered wins.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_COVERAGE_FORMLOCATOR_H
#define MUTAGEN_COVERAGE_FORMLOCATOR_H

#include "mutagen/Support/LLVM.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"
#include <optional>
#include <string>
#include <vector>

namespace mutagen {

/// Where a form starts, as reported by the form-location bridge.
struct FormAnchor {
  std::string formId;
  std::string file;
  unsigned line = 0;

  bool operator==(const FormAnchor &other) const {
    return formId == other.formId && file == other.file && line == other.line;
  }
};

llvm::json::Value toJSON(const FormAnchor &anchor);
bool fromJSON(const llvm::json::Value &value, FormAnchor &anchor,
              llvm::json::Path path);

class FormLocator {
public:
  /// Register a form. A later registration of the same id replaces the
  /// earlier one.
  void add(const FormAnchor &anchor);
  void add(StringRef formId, StringRef file, unsigned line) {
    add(FormAnchor{formId.str(), file.str(), line});
  }

  /// The id of the form containing `line` in `file`, if any form of that file
  /// starts at or before it.
  std::optional<StringRef> locate(StringRef file, unsigned line) const;

  /// The anchor registered for `formId`, or null.
  const FormAnchor *lookup(StringRef formId) const;

  /// All anchors, ordered by file then line.
  std::vector<FormAnchor> getAnchors() const;

  size_t size() const { return byId.size(); }
  bool empty() const { return byId.empty(); }

private:
  /// file -> anchors sorted by line, stable for equal lines.
  llvm::StringMap<std::vector<FormAnchor>> byFile;
  llvm::StringMap<FormAnchor> byId;
};

} // namespace mutagen

#endif // MUTAGEN_COVERAGE_FORMLOCATOR_H
