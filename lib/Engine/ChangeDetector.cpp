//===- ChangeDetector.cpp - Form-level incremental comparison -------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Engine/ChangeDetector.h"
#include "mutagen/Support/MutagenError.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#define DEBUG_TYPE "mutagen-changes"

using namespace mutagen;

ContentHash mutagen::computeUnitDigest(const TestUnitConfig &unit) {
  ContentHash hash = ContentHash::fromString(unit.id);
  auto fileHash = ContentHash::fromFile(unit.file);
  if (fileHash) {
    hash = hash.combine(*fileHash);
  } else {
    llvm::consumeError(fileHash.takeError());
    hash = hash.combine(ContentHash::fromString("<missing>" + unit.file));
  }
  for (const std::string &test : unit.tests)
    hash = hash.combine(ContentHash::fromString(test));
  return hash;
}

ContentHash
mutagen::computeSelectionDigest(ArrayRef<std::string> operatorIds,
                                const MutationSettings &settings) {
  ContentHash hash = ContentHash::fromString("operators");
  for (const std::string &id : operatorIds)
    hash = hash.combine(ContentHash::fromString(id));
  std::string cluster = "cluster:" + settings.clusterKey + ":" +
                        std::to_string(settings.coordinatePrefix);
  hash = hash.combine(ContentHash::fromString(cluster));
  for (const std::string &head : settings.skipForms)
    hash = hash.combine(ContentHash::fromString("skip:" + head));
  return hash;
}

//===----------------------------------------------------------------------===//
// DigestTable
//===----------------------------------------------------------------------===//

DigestTable DigestTable::fromDocuments(ArrayRef<const Document *> documents) {
  DigestTable table;
  for (const Document *document : documents)
    for (const Form &form : document->getForms())
      table.addForm({form.id, form.file, form.startLine, form.digest});
  return table;
}

void DigestTable::addForm(FormDigest form) {
  auto inserted = formIndex.try_emplace(form.formId, forms.size());
  if (!inserted.second) {
    forms[inserted.first->getValue()] = std::move(form);
    return;
  }
  forms.push_back(std::move(form));
}

void DigestTable::setUnitDigest(StringRef unitId, const ContentHash &digest) {
  unitDigests[unitId] = digest;
}

const FormDigest *DigestTable::lookupForm(StringRef formId) const {
  auto it = formIndex.find(formId);
  return it == formIndex.end() ? nullptr : &forms[it->getValue()];
}

std::optional<ContentHash> DigestTable::getUnitDigest(StringRef unitId) const {
  auto it = unitDigests.find(unitId);
  if (it == unitDigests.end())
    return std::nullopt;
  return it->getValue();
}

llvm::json::Value DigestTable::toJSON() const {
  llvm::json::Array formsArray;
  for (const FormDigest &form : forms)
    formsArray.push_back(llvm::json::Object{
        {"form", form.formId},
        {"file", form.file},
        {"line", static_cast<int64_t>(form.line)},
        {"digest", form.digest.toHexString()}});

  llvm::json::Object units;
  for (const auto &entry : unitDigests)
    units[entry.getKey().str()] = entry.getValue().toHexString();

  llvm::json::Object root{{"version", VERSION},
                          {"forms", std::move(formsArray)},
                          {"units", std::move(units)}};
  if (selection)
    root["selection"] = selection->toHexString();
  return root;
}

llvm::Expected<DigestTable>
DigestTable::fromJSON(const llvm::json::Value &json) {
  auto *root = json.getAsObject();
  if (!root)
    return makeError(ErrorKind::StateError, "digest root must be an object");
  auto version = root->getInteger("version");
  if (!version || *version != VERSION)
    return makeError(ErrorKind::StateError,
                     "unsupported digest state version");

  DigestTable table;
  if (auto selectionText = root->getString("selection")) {
    auto selection = ContentHash::fromHexString(*selectionText);
    if (!selection)
      return makeError(ErrorKind::StateError, "malformed selection digest");
    table.setSelectionDigest(*selection);
  }

  auto *formsArray = root->getArray("forms");
  if (!formsArray)
    return makeError(ErrorKind::StateError, "digest state has no forms");
  for (const auto &item : *formsArray) {
    auto *obj = item.getAsObject();
    if (!obj)
      return makeError(ErrorKind::StateError, "form digest must be an object");
    auto formId = obj->getString("form");
    auto file = obj->getString("file");
    auto line = obj->getInteger("line");
    auto digestText = obj->getString("digest");
    std::optional<ContentHash> digest;
    if (digestText)
      digest = ContentHash::fromHexString(*digestText);
    if (!formId || !file || !line || *line < 0 || !digest)
      return makeError(ErrorKind::StateError, "malformed form digest");
    table.addForm({formId->str(), file->str(), static_cast<unsigned>(*line),
                   *digest});
  }

  if (auto *units = root->getObject("units")) {
    for (const auto &entry : *units) {
      auto text = entry.second.getAsString();
      std::optional<ContentHash> digest;
      if (text)
        digest = ContentHash::fromHexString(*text);
      if (!digest)
        return makeError(ErrorKind::StateError,
                         "malformed digest of unit '" + entry.first.str() +
                             "'");
      table.setUnitDigest(entry.first, *digest);
    }
  }
  return table;
}

llvm::Error DigestTable::save(StringRef path) const {
  StringRef parent = llvm::sys::path::parent_path(path);
  if (!parent.empty())
    if (auto ec = llvm::sys::fs::create_directories(parent))
      return llvm::createStringError(ec, "failed to create '%s'",
                                     parent.str().c_str());

  std::error_code ec;
  llvm::raw_fd_ostream os(path, ec);
  if (ec)
    return llvm::createStringError(ec, "failed to open '%s' for writing",
                                   path.str().c_str());
  os << toJSON();
  return llvm::Error::success();
}

llvm::Expected<DigestTable> DigestTable::load(StringRef path) {
  if (!llvm::sys::fs::exists(path))
    return DigestTable();

  auto bufferOrErr = llvm::MemoryBuffer::getFile(path);
  if (!bufferOrErr)
    return makeError(ErrorKind::StateError,
                     "failed to read '" + path +
                         "': " + bufferOrErr.getError().message());
  auto jsonOrErr = llvm::json::parse(bufferOrErr.get()->getBuffer());
  if (!jsonOrErr)
    return makeError(ErrorKind::StateError,
                     "corrupt digest state '" + path +
                         "': " + llvm::toString(jsonOrErr.takeError()));
  return fromJSON(*jsonOrErr);
}

//===----------------------------------------------------------------------===//
// ChangeSet
//===----------------------------------------------------------------------===//

StringRef mutagen::getChangeKindName(ChangeKind kind) {
  switch (kind) {
  case ChangeKind::Added:
    return "added";
  case ChangeKind::Modified:
    return "modified";
  case ChangeKind::SelectionChanged:
    return "selection-changed";
  case ChangeKind::TestsChanged:
    return "tests-changed";
  case ChangeKind::Unchanged:
    return "unchanged";
  case ChangeKind::Removed:
    return "removed";
  }
  llvm_unreachable("unknown change kind");
}

void ChangeSet::add(FormChange change) {
  byForm[change.formId] = change.kind;
  changes.push_back(std::move(change));
}

bool ChangeSet::isChanged(StringRef formId) const {
  auto it = byForm.find(formId);
  if (it == byForm.end())
    return false;
  ChangeKind kind = it->getValue();
  return kind == ChangeKind::Added || kind == ChangeKind::Modified ||
         kind == ChangeKind::SelectionChanged ||
         kind == ChangeKind::TestsChanged;
}

llvm::StringSet<> ChangeSet::getChangedForms() const {
  llvm::StringSet<> result;
  for (const FormChange &change : changes)
    if (isChanged(change.formId))
      result.insert(change.formId);
  return result;
}

llvm::StringSet<> ChangeSet::getUnchangedForms() const {
  llvm::StringSet<> result;
  for (const FormChange &change : changes)
    if (change.kind == ChangeKind::Unchanged)
      result.insert(change.formId);
  return result;
}

size_t ChangeSet::count(ChangeKind kind) const {
  size_t n = 0;
  for (const FormChange &change : changes)
    if (change.kind == kind)
      ++n;
  return n;
}

//===----------------------------------------------------------------------===//
// ChangeDetector
//===----------------------------------------------------------------------===//

ChangeSet ChangeDetector::detect(const DigestTable &current,
                                 TestsChangedFn testsChanged) const {
  ChangeSet changes;
  bool selectionChanged =
      previous.getSelectionDigest() != current.getSelectionDigest();
  for (const FormDigest &form : current.getForms()) {
    const FormDigest *old = previous.lookupForm(form.formId);
    ChangeKind kind;
    if (!old || old->file != form.file)
      kind = ChangeKind::Added;
    else if (old->digest != form.digest)
      kind = ChangeKind::Modified;
    else if (selectionChanged)
      kind = ChangeKind::SelectionChanged;
    else if (testsChanged(form))
      kind = ChangeKind::TestsChanged;
    else
      kind = ChangeKind::Unchanged;
    LLVM_DEBUG(llvm::dbgs() << form.formId << ": " << getChangeKindName(kind)
                            << "\n");
    changes.add({form.formId, form.file, kind});
  }

  for (const FormDigest &old : previous.getForms())
    if (!current.lookupForm(old.formId))
      changes.add({old.formId, old.file, ChangeKind::Removed});
  return changes;
}

llvm::StringSet<>
ChangeDetector::getChangedUnits(const DigestTable &current) const {
  llvm::StringSet<> changed;
  for (const auto &entry : current.getUnitDigests()) {
    auto old = previous.getUnitDigest(entry.getKey());
    if (!old || *old != entry.getValue())
      changed.insert(entry.getKey());
  }
  return changed;
}
