//===- MutationReport.cpp - Verdict tally and persisted results -----------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Engine/MutationReport.h"
#include "mutagen/Support/MutagenError.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include <algorithm>
#include <tuple>

using namespace mutagen;

SiteResult SiteResult::fromSite(const MutationSite &site) {
  SiteResult result;
  result.siteId = site.getId();
  result.formId = site.formId;
  result.coord = site.coord.toString();
  result.operatorId = site.operatorId;
  result.file = site.file;
  result.line = site.line;
  result.original = site.original;
  result.replacement = site.replacement;
  return result;
}

const SiteResult *MutationReport::lookup(StringRef siteId) const {
  auto it = llvm::find_if(results, [&](const SiteResult &result) {
    return result.siteId == siteId;
  });
  return it == results.end() ? nullptr : &*it;
}

size_t MutationReport::count(VerdictKind kind) const {
  return llvm::count_if(results, [&](const SiteResult &result) {
    return result.verdict == kind;
  });
}

std::optional<double> MutationReport::getScore() const {
  size_t killed = count(VerdictKind::Killed);
  size_t survived = count(VerdictKind::Survived);
  if (killed + survived == 0)
    return std::nullopt;
  return static_cast<double>(killed) / static_cast<double>(killed + survived);
}

void MutationReport::mergeFrom(const MutationReport &previous,
                               const llvm::StringSet<> &forms) {
  llvm::StringSet<> known;
  for (const SiteResult &result : results)
    known.insert(result.siteId);
  for (const ExcludedResult &excluded : equivalent)
    known.insert(excluded.siteId);
  for (const ExcludedResult &excluded : subsumed)
    known.insert(excluded.siteId);

  for (const SiteResult &result : previous.results)
    if (forms.contains(result.formId) && known.insert(result.siteId).second)
      results.push_back(result);
  for (const ExcludedResult &excluded : previous.equivalent)
    if (forms.contains(excluded.formId) && known.insert(excluded.siteId).second)
      equivalent.push_back(excluded);
  for (const ExcludedResult &excluded : previous.subsumed)
    if (forms.contains(excluded.formId) && known.insert(excluded.siteId).second)
      subsumed.push_back(excluded);
}

void MutationReport::sort() {
  auto byLocation = [](const auto &a, const auto &b) {
    return std::tie(a.file, a.line, a.siteId) <
           std::tie(b.file, b.line, b.siteId);
  };
  std::stable_sort(results.begin(), results.end(), byLocation);
  std::stable_sort(equivalent.begin(), equivalent.end(), byLocation);
  std::stable_sort(subsumed.begin(), subsumed.end(), byLocation);
}

//===----------------------------------------------------------------------===//
// JSON
//===----------------------------------------------------------------------===//

static llvm::json::Value toJSON(const ExcludedResult &excluded,
                                StringRef whyKey) {
  return llvm::json::Object{{"site", excluded.siteId},
                            {"form", excluded.formId},
                            {"file", excluded.file},
                            {"line", static_cast<int64_t>(excluded.line)},
                            {whyKey.str(), excluded.why}};
}

static std::optional<ExcludedResult>
excludedFromJSON(const llvm::json::Value &value, StringRef whyKey) {
  auto *obj = value.getAsObject();
  if (!obj)
    return std::nullopt;
  auto site = obj->getString("site");
  auto form = obj->getString("form");
  auto file = obj->getString("file");
  auto line = obj->getInteger("line");
  auto why = obj->getString(whyKey);
  if (!site || !form || !file || !line || *line < 0 || !why)
    return std::nullopt;
  return ExcludedResult{site->str(), form->str(), file->str(),
                        static_cast<unsigned>(*line), why->str()};
}

llvm::json::Value MutationReport::toJSON() const {
  llvm::json::Array resultsArray;
  for (const SiteResult &result : results) {
    llvm::json::Object obj;
    obj["site"] = result.siteId;
    obj["form"] = result.formId;
    obj["coord"] = result.coord;
    obj["operator"] = result.operatorId;
    obj["file"] = result.file;
    obj["line"] = static_cast<int64_t>(result.line);
    obj["original"] = result.original;
    obj["replacement"] = result.replacement;
    obj["verdict"] = getVerdictName(result.verdict);
    obj["detail"] = result.detail;
    llvm::json::Array tests;
    for (const std::string &test : result.tests)
      tests.push_back(test);
    obj["tests"] = std::move(tests);
    if (!result.representative.empty())
      obj["representative"] = result.representative;
    resultsArray.push_back(std::move(obj));
  }

  llvm::json::Array equivalentArray;
  for (const ExcludedResult &excluded : equivalent)
    equivalentArray.push_back(::toJSON(excluded, "reason"));
  llvm::json::Array subsumedArray;
  for (const ExcludedResult &excluded : subsumed)
    subsumedArray.push_back(::toJSON(excluded, "dominator"));

  llvm::json::Object summary;
  summary["killed"] = static_cast<int64_t>(count(VerdictKind::Killed));
  summary["survived"] = static_cast<int64_t>(count(VerdictKind::Survived));
  summary["no-coverage"] =
      static_cast<int64_t>(count(VerdictKind::NoCoverage));
  summary["timeout"] = static_cast<int64_t>(count(VerdictKind::Timeout));
  summary["error"] = static_cast<int64_t>(count(VerdictKind::Error));
  summary["equivalent"] = static_cast<int64_t>(equivalent.size());
  summary["subsumed"] = static_cast<int64_t>(subsumed.size());
  if (auto score = getScore())
    summary["score"] = *score;
  else
    summary["score"] = nullptr;

  return llvm::json::Object{{"version", VERSION},
                            {"results", std::move(resultsArray)},
                            {"equivalent", std::move(equivalentArray)},
                            {"subsumed", std::move(subsumedArray)},
                            {"summary", std::move(summary)}};
}

llvm::Expected<MutationReport>
MutationReport::fromJSON(const llvm::json::Value &json) {
  auto *root = json.getAsObject();
  if (!root)
    return makeError(ErrorKind::StateError, "results root must be an object");
  auto version = root->getInteger("version");
  if (!version || *version != VERSION)
    return makeError(ErrorKind::StateError,
                     "unsupported results state version");

  MutationReport report;
  if (auto *resultsArray = root->getArray("results")) {
    for (const auto &item : *resultsArray) {
      auto *obj = item.getAsObject();
      if (!obj)
        return makeError(ErrorKind::StateError, "result must be an object");
      auto site = obj->getString("site");
      auto form = obj->getString("form");
      auto coord = obj->getString("coord");
      auto op = obj->getString("operator");
      auto file = obj->getString("file");
      auto line = obj->getInteger("line");
      auto verdictName = obj->getString("verdict");
      std::optional<VerdictKind> verdict;
      if (verdictName)
        verdict = parseVerdictName(*verdictName);
      if (!site || !form || !coord || !op || !file || !line || *line < 0 ||
          !verdict)
        return makeError(ErrorKind::StateError, "malformed result");

      SiteResult result;
      result.siteId = site->str();
      result.formId = form->str();
      result.coord = coord->str();
      result.operatorId = op->str();
      result.file = file->str();
      result.line = static_cast<unsigned>(*line);
      result.original = obj->getString("original").getValueOr("").str();
      result.replacement = obj->getString("replacement").getValueOr("").str();
      result.verdict = *verdict;
      result.detail = obj->getString("detail").getValueOr("").str();
      result.representative =
          obj->getString("representative").getValueOr("").str();
      if (auto *tests = obj->getArray("tests"))
        for (const auto &test : *tests)
          if (auto name = test.getAsString())
            result.tests.push_back(name->str());
      report.addResult(std::move(result));
    }
  }

  if (auto *array = root->getArray("equivalent")) {
    for (const auto &item : *array) {
      auto excluded = excludedFromJSON(item, "reason");
      if (!excluded)
        return makeError(ErrorKind::StateError, "malformed equivalent site");
      report.addEquivalent(std::move(*excluded));
    }
  }
  if (auto *array = root->getArray("subsumed")) {
    for (const auto &item : *array) {
      auto excluded = excludedFromJSON(item, "dominator");
      if (!excluded)
        return makeError(ErrorKind::StateError, "malformed subsumed site");
      report.addSubsumed(std::move(*excluded));
    }
  }
  return report;
}

llvm::Error MutationReport::save(StringRef path) const {
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
  os << llvm::formatv("{0:2}", toJSON()) << "\n";
  return llvm::Error::success();
}

llvm::Expected<MutationReport> MutationReport::load(StringRef path) {
  if (!llvm::sys::fs::exists(path))
    return MutationReport();

  auto bufferOrErr = llvm::MemoryBuffer::getFile(path);
  if (!bufferOrErr)
    return makeError(ErrorKind::StateError,
                     "failed to read '" + path +
                         "': " + bufferOrErr.getError().message());
  auto jsonOrErr = llvm::json::parse(bufferOrErr.get()->getBuffer());
  if (!jsonOrErr)
    return makeError(ErrorKind::StateError,
                     "corrupt results state '" + path +
                         "': " + llvm::toString(jsonOrErr.takeError()));
  return fromJSON(*jsonOrErr);
}

//===----------------------------------------------------------------------===//
// Text Writer
//===----------------------------------------------------------------------===//

void MutationReport::print(llvm::raw_ostream &os, bool verbose) const {
  os << "Mutation Report\n";
  os << "============================================================\n\n";

  os << "Summary:\n";
  os << "  Mutants:     " << results.size() << "\n";
  os << "  Killed:      " << count(VerdictKind::Killed) << "\n";
  os << "  Survived:    " << count(VerdictKind::Survived) << "\n";
  os << "  No coverage: " << count(VerdictKind::NoCoverage) << "\n";
  os << "  Timeout:     " << count(VerdictKind::Timeout) << "\n";
  os << "  Errors:      " << count(VerdictKind::Error) << "\n";
  os << "  Equivalent:  " << equivalent.size() << "\n";
  os << "  Subsumed:    " << subsumed.size() << "\n";
  os << "  Score:       ";
  if (auto score = getScore())
    os << llvm::format("%.1f%%", *score * 100.0) << "\n\n";
  else
    os << "n/a\n\n";

  for (const SiteResult &result : results) {
    switch (result.verdict) {
    case VerdictKind::Killed:
      if (!verbose)
        continue;
      os << "  [KILL] ";
      break;
    case VerdictKind::Survived:
      os << "  [SURV] ";
      break;
    case VerdictKind::NoCoverage:
      os << "  [NCOV] ";
      break;
    case VerdictKind::Timeout:
      os << "  [TIME] ";
      break;
    case VerdictKind::Error:
      os << "  [ERR]  ";
      break;
    case VerdictKind::Pending:
      os << "  [PEND] ";
      break;
    }
    os << result.file << ":" << result.line << ": " << result.operatorId
       << ": " << result.original << " -> " << result.replacement << "\n";
    if (verbose && !result.detail.empty())
      os << "         " << result.detail << "\n";
  }

  if (verbose) {
    for (const ExcludedResult &excluded : equivalent)
      os << "  [EQUV] " << excluded.siteId << ": " << excluded.why << "\n";
    for (const ExcludedResult &excluded : subsumed)
      os << "  [SUBS] " << excluded.siteId << " by " << excluded.why << "\n";
  }
}
