//===- OperatorCatalog.cpp - Validated set of mutation operators ----------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Mutation/OperatorCatalog.h"
#include "mutagen/Support/MutagenError.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/Twine.h"

using namespace mutagen;

static const StringRef presetNames[] = {"fast", "default", "all"};

ArrayRef<StringRef> OperatorCatalog::getPresetNames() { return presetNames; }

//===----------------------------------------------------------------------===//
// Construction
//===----------------------------------------------------------------------===//

llvm::Expected<OperatorCatalog>
OperatorCatalog::create(std::vector<Operator> operators) {
  OperatorCatalog catalog;
  catalog.operators = std::move(operators);
  for (unsigned i = 0, e = catalog.operators.size(); i < e; ++i) {
    const Operator &op = catalog.operators[i];
    if (op.id.empty())
      return makeError(ErrorKind::CatalogError,
                       "operator #" + Twine(i) + " has no id");
    if (!catalog.index.try_emplace(op.id, i).second)
      return makeError(ErrorKind::CatalogError,
                       "duplicate operator '" + op.id + "'");
  }
  if (auto err = catalog.validate())
    return std::move(err);
  catalog.computeClosures();
  catalog.computePresets();
  return catalog;
}

const OperatorCatalog &OperatorCatalog::getBuiltin() {
  static const OperatorCatalog builtin =
      llvm::cantFail(create(getBuiltinOperators()));
  return builtin;
}

llvm::Error OperatorCatalog::validate() const {
  for (const Operator &op : operators) {
    if (!op.matches || !op.generate)
      return makeError(ErrorKind::CatalogError,
                       "operator '" + op.id +
                           "' needs a matcher and a generator");
    if (op.hardness < 0.0 || op.hardness > 1.0)
      return makeError(ErrorKind::CatalogError,
                       "hardness of operator '" + op.id +
                           "' is outside [0, 1]");
    if (op.equivalence && !op.equivalence->holds)
      return makeError(ErrorKind::CatalogError,
                       "equivalence rule of operator '" + op.id +
                           "' has no predicate");
    for (const std::string &target : op.dominates) {
      const Operator *other = lookup(target);
      if (!other)
        return makeError(ErrorKind::CatalogError,
                         "operator '" + op.id + "' dominates unknown '" +
                             target + "'");
      if (other->family != op.family)
        return makeError(ErrorKind::CatalogError,
                         "edge '" + op.id + "' -> '" + target +
                             "' leaves family '" + op.family + "'");
    }
  }

  // Depth-first search for a back edge.
  enum class Mark { Unvisited, Active, Done };
  std::vector<Mark> marks(operators.size(), Mark::Unvisited);
  std::function<llvm::Error(unsigned)> visit =
      [&](unsigned i) -> llvm::Error {
    marks[i] = Mark::Active;
    for (const std::string &target : operators[i].dominates) {
      unsigned j = index.lookup(target);
      if (marks[j] == Mark::Active)
        return makeError(ErrorKind::CatalogError,
                         "family '" + operators[i].family +
                             "' has a dominance cycle through '" + target +
                             "'");
      if (marks[j] == Mark::Unvisited)
        if (auto err = visit(j))
          return err;
    }
    marks[i] = Mark::Done;
    return llvm::Error::success();
  };
  for (unsigned i = 0, e = operators.size(); i < e; ++i)
    if (marks[i] == Mark::Unvisited)
      if (auto err = visit(i))
        return err;
  return llvm::Error::success();
}

void OperatorCatalog::computeClosures() {
  closures.assign(operators.size(), llvm::StringSet<>());
  std::vector<bool> done(operators.size(), false);
  std::function<void(unsigned)> visit = [&](unsigned i) {
    if (done[i])
      return;
    done[i] = true;
    for (const std::string &target : operators[i].dominates) {
      unsigned j = index.lookup(target);
      visit(j);
      closures[i].insert(target);
      for (const auto &entry : closures[j])
        closures[i].insert(entry.getKey());
    }
  };
  for (unsigned i = 0, e = operators.size(); i < e; ++i)
    visit(i);
}

void OperatorCatalog::computePresets() {
  auto &fast = presets["fast"];
  auto &defaults = presets["default"];
  auto &all = presets["all"];
  for (unsigned i = 0, e = operators.size(); i < e; ++i) {
    const Operator &op = operators[i];
    all.push_back(op.id);
    if (op.category != OperatorCategory::Constant)
      defaults.push_back(op.id);

    switch (op.category) {
    case OperatorCategory::Relational: {
      bool dominated = llvm::any_of(closures, [&](const llvm::StringSet<> &s) {
        return s.contains(op.id);
      });
      if (!dominated)
        fast.push_back(op.id);
      break;
    }
    case OperatorCategory::Arithmetic:
    case OperatorCategory::Logical:
    case OperatorCategory::Negation:
      fast.push_back(op.id);
      break;
    default:
      break;
    }
  }
}

//===----------------------------------------------------------------------===//
// Queries
//===----------------------------------------------------------------------===//

const Operator *OperatorCatalog::lookup(StringRef id) const {
  auto it = index.find(id);
  return it == index.end() ? nullptr : &operators[it->getValue()];
}

std::optional<unsigned> OperatorCatalog::getIndex(StringRef id) const {
  auto it = index.find(id);
  if (it == index.end())
    return std::nullopt;
  return it->getValue();
}

const llvm::StringSet<> &OperatorCatalog::getDominated(StringRef id) const {
  static const llvm::StringSet<> none;
  auto it = index.find(id);
  return it == index.end() ? none : closures[it->getValue()];
}

llvm::Expected<std::vector<std::string>>
OperatorCatalog::getPreset(StringRef name) const {
  auto it = presets.find(name);
  if (it == presets.end())
    return makeError(ErrorKind::ConfigError,
                     "unknown operator preset '" + name +
                         "' (expected fast, default or all)");
  return it->getValue();
}

llvm::Expected<OperatorCatalog>
OperatorCatalog::select(StringRef preset, ArrayRef<std::string> allow,
                        ArrayRef<std::string> disable) const {
  std::vector<std::string> chosen;
  if (!allow.empty()) {
    chosen.assign(allow.begin(), allow.end());
  } else {
    auto ids = getPreset(preset);
    if (!ids)
      return ids.takeError();
    chosen = std::move(*ids);
  }

  llvm::StringSet<> selected;
  for (const std::string &id : chosen) {
    if (!lookup(id))
      return makeError(ErrorKind::ConfigError,
                       "unknown mutation operator '" + id + "'");
    selected.insert(id);
  }
  for (const std::string &id : disable) {
    if (!lookup(id))
      return makeError(ErrorKind::ConfigError,
                       "cannot disable unknown mutation operator '" + id +
                           "'");
    selected.erase(id);
  }

  std::vector<Operator> subset;
  for (unsigned i = 0, e = operators.size(); i < e; ++i) {
    const Operator &op = operators[i];
    if (!selected.contains(op.id))
      continue;
    Operator copy = op;
    copy.dominates.clear();
    // Closure edges keep dominance through operators left out of the subset.
    for (const Operator &other : operators)
      if (selected.contains(other.id) && closures[i].contains(other.id))
        copy.dominates.push_back(other.id);
    subset.push_back(std::move(copy));
  }
  return create(std::move(subset));
}
