//===- CoverageIndex.cpp - Test to syntax location coverage ---------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Coverage/CoverageIndex.h"
#include "mutagen/Support/MutagenError.h"
#include "llvm/ADT/Twine.h"
#include <algorithm>

using namespace mutagen;

//===----------------------------------------------------------------------===//
// Building
//===----------------------------------------------------------------------===//

void CoverageIndex::record(StringRef testId, StringRef formId,
                           const Coordinate &coord) {
  std::string coordText = coord.toString();
  forward[testId].insert({formId.str(), coordText});
  inverse[formId][coordText].insert(testId.str());
}

void CoverageIndex::addTest(StringRef testId) { forward[testId]; }

void CoverageIndex::removeTest(StringRef testId) {
  if (forward.erase(testId))
    rebuildInverse();
}

void CoverageIndex::merge(const CoverageIndex &other) {
  for (const auto &entry : other.forward) {
    auto &locations = forward[entry.getKey()];
    for (const CoveredLocation &location : entry.getValue()) {
      locations.insert(location);
      inverse[location.first][location.second].insert(entry.getKey().str());
    }
  }
}

void CoverageIndex::clear() {
  forward.clear();
  inverse.clear();
}

void CoverageIndex::rebuildInverse() {
  inverse.clear();
  for (const auto &entry : forward)
    for (const CoveredLocation &location : entry.getValue())
      inverse[location.first][location.second].insert(entry.getKey().str());
}

//===----------------------------------------------------------------------===//
// Queries
//===----------------------------------------------------------------------===//

std::vector<std::string>
CoverageIndex::testsFor(StringRef formId, const Coordinate &coord) const {
  auto formIt = inverse.find(formId);
  if (formIt == inverse.end())
    return {};
  auto coordIt = formIt->getValue().find(coord.toString());
  if (coordIt == formIt->getValue().end())
    return {};
  return std::vector<std::string>(coordIt->second.begin(),
                                  coordIt->second.end());
}

std::vector<std::string>
CoverageIndex::testsCovering(StringRef formId, const Coordinate &coord,
                             bool leaf) const {
  std::vector<std::string> tests = testsFor(formId, coord);
  if (tests.empty() && leaf && !coord.empty())
    return testsFor(formId, coord.dropBack(1));
  return tests;
}

std::vector<std::string> CoverageIndex::testsInForm(StringRef formId) const {
  auto formIt = inverse.find(formId);
  if (formIt == inverse.end())
    return {};
  std::set<std::string> tests;
  for (const auto &entry : formIt->getValue())
    tests.insert(entry.second.begin(), entry.second.end());
  return std::vector<std::string>(tests.begin(), tests.end());
}

std::vector<CoveredLocation>
CoverageIndex::locationsFor(StringRef testId) const {
  auto it = forward.find(testId);
  if (it == forward.end())
    return {};
  return std::vector<CoveredLocation>(it->getValue().begin(),
                                      it->getValue().end());
}

std::vector<std::string> CoverageIndex::getTestIds() const {
  std::vector<std::string> ids;
  for (const auto &entry : forward)
    ids.push_back(entry.getKey().str());
  std::sort(ids.begin(), ids.end());
  return ids;
}

size_t CoverageIndex::getNumLocations() const {
  size_t count = 0;
  for (const auto &entry : inverse)
    count += entry.getValue().size();
  return count;
}

bool CoverageIndex::operator==(const CoverageIndex &other) const {
  if (forward.size() != other.forward.size())
    return false;
  for (const auto &entry : forward) {
    auto it = other.forward.find(entry.getKey());
    if (it == other.forward.end() || it->getValue() != entry.getValue())
      return false;
  }
  return true;
}

//===----------------------------------------------------------------------===//
// Serialization
//===----------------------------------------------------------------------===//

llvm::json::Value CoverageIndex::toJSON() const {
  llvm::json::Object root;
  for (const std::string &testId : getTestIds()) {
    llvm::json::Array locations;
    for (const CoveredLocation &location : forward.find(testId)->getValue())
      locations.push_back(
          llvm::json::Object{{"form", location.first},
                             {"coord", location.second}});
    root[testId] = std::move(locations);
  }
  return root;
}

llvm::Expected<CoverageIndex>
CoverageIndex::fromJSON(const llvm::json::Value &json) {
  auto *root = json.getAsObject();
  if (!root)
    return makeError(ErrorKind::StateError,
                     "coverage records must be a JSON object");

  CoverageIndex index;
  for (const auto &entry : *root) {
    StringRef testId = entry.first;
    auto *locations = entry.second.getAsArray();
    if (!locations)
      return makeError(ErrorKind::StateError,
                       "coverage of test '" + testId + "' must be an array");
    index.addTest(testId);
    for (const auto &item : *locations) {
      auto *obj = item.getAsObject();
      if (!obj)
        return makeError(ErrorKind::StateError,
                         "malformed coverage entry for test '" + testId + "'");
      auto form = obj->getString("form");
      auto coordText = obj->getString("coord");
      if (!form || !coordText)
        return makeError(ErrorKind::StateError,
                         "malformed coverage entry for test '" + testId + "'");
      auto coord = Coordinate::parse(*coordText);
      if (!coord) {
        llvm::consumeError(coord.takeError());
        return makeError(ErrorKind::StateError,
                         "malformed coordinate '" + *coordText +
                             "' for test '" + testId + "'");
      }
      index.record(testId, *form, *coord);
    }
  }
  return index;
}
