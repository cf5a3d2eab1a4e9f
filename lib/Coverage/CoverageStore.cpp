//===- CoverageStore.cpp - Persisted per-unit coverage --------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Coverage/CoverageStore.h"
#include "mutagen/Support/MutagenError.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"
#include <algorithm>

#define DEBUG_TYPE "mutagen-coverage"

using namespace mutagen;

ContentHash mutagen::computeDependencyHash(const TestUnitConfig &unit) {
  std::vector<std::string> paths(unit.depends.begin(), unit.depends.end());
  paths.push_back(unit.file);
  std::sort(paths.begin(), paths.end());
  paths.erase(std::unique(paths.begin(), paths.end()), paths.end());

  ContentHash hash;
  for (const std::string &path : paths) {
    auto fileHash = ContentHash::fromFile(path);
    if (!fileHash) {
      llvm::consumeError(fileHash.takeError());
      hash = hash.combine(ContentHash::fromString("<missing>" + path));
      continue;
    }
    hash = hash.combine(*fileHash);
  }
  return hash;
}

//===----------------------------------------------------------------------===//
// Units
//===----------------------------------------------------------------------===//

llvm::Error CoverageStore::checkFresh(StringRef unitId,
                                      const ContentHash &hash) const {
  const UnitCoverage *unit = lookup(unitId);
  if (!unit)
    return makeError(ErrorKind::IndexStaleness,
                     "no coverage recorded for unit '" + unitId + "'");
  if (unit->dependencyHash != hash)
    return makeError(ErrorKind::IndexStaleness,
                     "coverage of unit '" + unitId + "' was computed for " +
                         unit->dependencyHash.toHexString() + ", sources are " +
                         hash.toHexString());
  return llvm::Error::success();
}

const UnitCoverage *CoverageStore::lookup(StringRef unitId) const {
  auto it = units.find(unitId.str());
  return it == units.end() ? nullptr : &it->second;
}

void CoverageStore::put(UnitCoverage unit) {
  std::string id = unit.unitId;
  units[id] = std::move(unit);
}

void CoverageStore::retainOnly(ArrayRef<HashedUnit> keep) {
  for (auto it = units.begin(); it != units.end();) {
    bool configured = llvm::any_of(keep, [&](const HashedUnit &unit) {
      return unit.config.id == it->first;
    });
    if (configured) {
      ++it;
      continue;
    }
    LLVM_DEBUG(llvm::dbgs() << "dropping coverage of removed unit '"
                            << it->first << "'\n");
    it = units.erase(it);
  }
}

llvm::Expected<std::vector<std::string>>
CoverageStore::refresh(ArrayRef<HashedUnit> hashedUnits,
                       RecomputeFn recompute) {
  std::vector<std::string> refreshed;
  for (const HashedUnit &unit : hashedUnits) {
    if (auto err = checkFresh(unit.config.id, unit.hash)) {
      std::string reason;
      auto kind = consumeMutagenError(std::move(err), &reason);
      if (kind != ErrorKind::IndexStaleness)
        return makeError(ErrorKind::StateError, reason);
      LLVM_DEBUG(llvm::dbgs() << "recomputing: " << reason << "\n");
    } else {
      continue;
    }

    auto coverage = recompute(unit.config);
    if (!coverage)
      return coverage.takeError();
    coverage->unitId = unit.config.id;
    coverage->dependencyHash = unit.hash;
    put(std::move(*coverage));
    refreshed.push_back(unit.config.id);
  }
  return refreshed;
}

llvm::Expected<CoverageIndex>
CoverageStore::getIndex(ArrayRef<HashedUnit> hashedUnits) const {
  CoverageIndex merged;
  for (const HashedUnit &unit : hashedUnits) {
    if (auto err = checkFresh(unit.config.id, unit.hash))
      return std::move(err);
    merged.merge(lookup(unit.config.id)->coverage);
  }
  return merged;
}

FormLocator CoverageStore::getLocator() const {
  FormLocator locator;
  for (const auto &entry : units)
    for (const FormAnchor &anchor : entry.second.bridge)
      locator.add(anchor);
  return locator;
}

std::vector<std::string> CoverageStore::getUnitIds() const {
  std::vector<std::string> ids;
  for (const auto &entry : units)
    ids.push_back(entry.first);
  return ids;
}

//===----------------------------------------------------------------------===//
// Persistence
//===----------------------------------------------------------------------===//

llvm::json::Value CoverageStore::toJSON() const {
  llvm::json::Array unitsArray;
  for (const auto &entry : units) {
    const UnitCoverage &unit = entry.second;
    llvm::json::Array bridge;
    for (const FormAnchor &anchor : unit.bridge)
      bridge.push_back(mutagen::toJSON(anchor));
    unitsArray.push_back(llvm::json::Object{
        {"id", unit.unitId},
        {"hash", unit.dependencyHash.toHexString()},
        {"tests", unit.coverage.toJSON()},
        {"bridge", std::move(bridge)}});
  }
  return llvm::json::Object{{"version", VERSION},
                            {"units", std::move(unitsArray)}};
}

llvm::Expected<CoverageStore>
CoverageStore::fromJSON(const llvm::json::Value &json) {
  auto *root = json.getAsObject();
  if (!root)
    return makeError(ErrorKind::StateError, "coverage root must be an object");
  auto version = root->getInteger("version");
  if (!version || *version != VERSION)
    return makeError(ErrorKind::StateError,
                     "unsupported coverage state version");

  CoverageStore store;
  auto *unitsArray = root->getArray("units");
  if (!unitsArray)
    return makeError(ErrorKind::StateError, "coverage state has no units");

  for (const auto &item : *unitsArray) {
    auto *obj = item.getAsObject();
    if (!obj)
      return makeError(ErrorKind::StateError,
                       "coverage unit must be an object");
    auto id = obj->getString("id");
    auto hashText = obj->getString("hash");
    std::optional<ContentHash> hash;
    if (hashText)
      hash = ContentHash::fromHexString(*hashText);
    const llvm::json::Value *tests = obj->get("tests");
    if (!id || !hash || !tests)
      return makeError(ErrorKind::StateError, "malformed coverage unit");

    UnitCoverage unit;
    unit.unitId = id->str();
    unit.dependencyHash = *hash;
    auto coverage = CoverageIndex::fromJSON(*tests);
    if (!coverage)
      return coverage.takeError();
    unit.coverage = std::move(*coverage);

    if (const llvm::json::Value *bridge = obj->get("bridge")) {
      llvm::json::Path::Root pathRoot("bridge");
      if (!llvm::json::fromJSON(*bridge, unit.bridge, pathRoot)) {
        std::string message;
        llvm::handleAllErrors(pathRoot.getError(),
                              [&](const llvm::ErrorInfoBase &e) {
                                message = e.message();
                              });
        return makeError(ErrorKind::StateError,
                         "malformed bridge of unit '" + unit.unitId +
                             "': " + message);
      }
    }
    store.put(std::move(unit));
  }
  return store;
}

llvm::Error CoverageStore::save(StringRef path) const {
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

llvm::Expected<CoverageStore> CoverageStore::load(StringRef path) {
  if (!llvm::sys::fs::exists(path))
    return CoverageStore();

  auto bufferOrErr = llvm::MemoryBuffer::getFile(path);
  if (!bufferOrErr)
    return makeError(ErrorKind::StateError,
                     "failed to read '" + path +
                         "': " + bufferOrErr.getError().message());

  auto jsonOrErr = llvm::json::parse(bufferOrErr.get()->getBuffer());
  if (!jsonOrErr)
    return makeError(ErrorKind::StateError,
                     "corrupt coverage state '" + path +
                         "': " + llvm::toString(jsonOrErr.takeError()));
  return fromJSON(*jsonOrErr);
}
