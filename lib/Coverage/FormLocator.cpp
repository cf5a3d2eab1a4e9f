//===- FormLocator.cpp - (file, line) to form id resolution ---------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Coverage/FormLocator.h"
#include "llvm/ADT/STLExtras.h"
#include <algorithm>

using namespace mutagen;

llvm::json::Value mutagen::toJSON(const FormAnchor &anchor) {
  return llvm::json::Object{{"form", anchor.formId},
                            {"file", anchor.file},
                            {"line", static_cast<int64_t>(anchor.line)}};
}

bool mutagen::fromJSON(const llvm::json::Value &value, FormAnchor &anchor,
                       llvm::json::Path path) {
  llvm::json::ObjectMapper mapper(value, path);
  int64_t line = 0;
  if (!mapper || !mapper.map("form", anchor.formId) ||
      !mapper.map("file", anchor.file) || !mapper.map("line", line))
    return false;
  if (line < 0) {
    path.field("line").report("expected a non-negative line");
    return false;
  }
  anchor.line = static_cast<unsigned>(line);
  return true;
}

void FormLocator::add(const FormAnchor &anchor) {
  auto existing = byId.find(anchor.formId);
  if (existing != byId.end()) {
    auto &anchors = byFile[existing->getValue().file];
    llvm::erase_if(anchors, [&](const FormAnchor &a) {
      return a.formId == anchor.formId;
    });
  }
  byId[anchor.formId] = anchor;

  auto &anchors = byFile[anchor.file];
  auto pos = std::upper_bound(
      anchors.begin(), anchors.end(), anchor.line,
      [](unsigned line, const FormAnchor &a) { return line < a.line; });
  anchors.insert(pos, anchor);
}

std::optional<StringRef> FormLocator::locate(StringRef file,
                                             unsigned line) const {
  auto it = byFile.find(file);
  if (it == byFile.end())
    return std::nullopt;
  const auto &anchors = it->getValue();

  // Last anchor starting at or before `line`.
  auto pos = std::upper_bound(
      anchors.begin(), anchors.end(), line,
      [](unsigned line, const FormAnchor &a) { return line < a.line; });
  if (pos == anchors.begin())
    return std::nullopt;
  unsigned startLine = std::prev(pos)->line;

  // First of the anchors sharing that start line.
  auto first = std::lower_bound(
      anchors.begin(), pos, startLine,
      [](const FormAnchor &a, unsigned line) { return a.line < line; });
  return StringRef(first->formId);
}

const FormAnchor *FormLocator::lookup(StringRef formId) const {
  auto it = byId.find(formId);
  return it == byId.end() ? nullptr : &it->getValue();
}

std::vector<FormAnchor> FormLocator::getAnchors() const {
  std::vector<StringRef> files;
  for (const auto &entry : byFile)
    files.push_back(entry.getKey());
  std::sort(files.begin(), files.end());

  std::vector<FormAnchor> result;
  for (StringRef file : files) {
    const auto &anchors = byFile.find(file)->getValue();
    result.insert(result.end(), anchors.begin(), anchors.end());
  }
  return result;
}
