//===- BuiltinOperators.cpp - Operators shipped with the engine -----------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Relational operators get their subsumption edges from three-region truth
// tables. A relation r holds on a subset of {a<b, a=b, a>b}; the mutant
// r -> r' is killed exactly on the regions where r and r' disagree. Mutant M1
// dominates M2 when M1's kill region is a non-empty strict subset of M2's:
// every input that kills M1 also kills M2.
//
//===----------------------------------------------------------------------===//

#include "mutagen/Mutation/OperatorCatalog.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/ADT/Twine.h"
#include "llvm/ADT/bit.h"
#include "llvm/Support/MathExtras.h"
#include <limits>

using namespace mutagen;

namespace {
enum Region : unsigned { Less = 1, Equal = 2, Greater = 4 };
} // namespace

static const StringRef relations[] = {"<", "<=", ">", ">=", "=", "not="};

std::optional<unsigned> mutagen::getRelationTruthMask(StringRef relation) {
  return llvm::StringSwitch<std::optional<unsigned>>(relation)
      .Case("<", Less)
      .Case("<=", Less | Equal)
      .Case(">", Greater)
      .Case(">=", Greater | Equal)
      .Case("=", Equal)
      .Case("not=", Less | Greater)
      .Case("true", Less | Equal | Greater)
      .Case("false", 0u)
      .Default(std::nullopt);
}

//===----------------------------------------------------------------------===//
// Helpers
//===----------------------------------------------------------------------===//

static bool isCallTo(const MatchContext &ctx, StringRef name) {
  auto callee = ctx.getCallee();
  return callee && *callee == name;
}

static std::optional<int64_t> getInteger(const Node *node) {
  if (auto *token = dyn_cast_or_null<TokenNode>(node))
    return token->getIntegerValue();
  return std::nullopt;
}

/// Render `value` as a literal of the same integer kind as `node`, keeping
/// the arbitrary-precision `N` suffix.
static std::string renderIntegerLike(const Node *node, int64_t value) {
  std::string text = std::to_string(value);
  if (cast<TokenNode>(node)->getText().endswith("N"))
    text += 'N';
  return text;
}

/// Render a call with its head symbol replaced, keeping all other text.
static std::optional<std::string> renderWithCallee(const MatchContext &ctx,
                                                   StringRef callee) {
  const SeqNode *list = ctx.getList();
  if (!list)
    return std::nullopt;
  auto significant = list->getSignificantIndices();
  if (significant.empty())
    return std::nullopt;
  auto oldChildren = list->getChildren();
  std::vector<NodePtr> children(oldChildren.begin(), oldChildren.end());
  children[significant.front()] =
      std::make_shared<TokenNode>(TokenKind::Symbol, callee.str());
  return list->withChildren(std::move(children))->toString();
}

static bool allOperandsIdentical(const MatchContext &ctx) {
  auto operands = ctx.getOperands();
  if (operands.empty())
    return false;
  std::string first = operands.front()->canonicalText();
  return llvm::all_of(operands, [&](const Node *operand) {
    return operand->canonicalText() == first;
  });
}

static bool evaluateRelation(unsigned mask, int64_t lhs, int64_t rhs) {
  unsigned region = lhs < rhs ? Less : lhs == rhs ? Equal : Greater;
  return mask & region;
}

/// A two-operand call `(callee a b)`.
static bool isBinaryCall(const MatchContext &ctx, StringRef callee) {
  return isCallTo(ctx, callee) && ctx.getOperands().size() == 2;
}

/// `(callee x <value>)` with an integer literal as the last operand.
static bool hasTrailingLiteral(const MatchContext &ctx, int64_t value) {
  auto operands = ctx.getOperands();
  if (operands.size() != 2)
    return false;
  auto literal = getInteger(operands.back());
  return literal && *literal == value;
}

//===----------------------------------------------------------------------===//
// Operator families
//===----------------------------------------------------------------------===//

static void addRelationalOperators(std::vector<Operator> &ops) {
  SmallVector<StringRef, 8> targets(std::begin(relations), std::end(relations));
  targets.push_back("true");
  targets.push_back("false");

  for (StringRef from : relations) {
    unsigned fromMask = *getRelationTruthMask(from);
    std::string family = ("ror." + from).str();

    auto killRegion = [&](StringRef to) {
      return fromMask ^ *getRelationTruthMask(to);
    };

    for (StringRef to : targets) {
      if (to == from)
        continue;
      unsigned kill = killRegion(to);

      Operator op;
      op.id = family + "->" + to.str();
      op.category = OperatorCategory::Relational;
      op.family = family;
      op.hardness = 1.0 - llvm::countPopulation(kill) / 3.0;
      for (StringRef other : targets) {
        if (other == from || other == to)
          continue;
        unsigned otherKill = killRegion(other);
        if (kill != 0 && (kill & otherKill) == kill && kill != otherKill)
          op.dominates.push_back(family + "->" + other.str());
      }

      std::string fromName = from.str();
      op.matches = [fromName](const MatchContext &ctx) {
        return isBinaryCall(ctx, fromName);
      };
      bool constant = to == "true" || to == "false";
      std::string toName = to.str();
      op.generate =
          [constant, toName](
              const MatchContext &ctx) -> std::optional<std::string> {
        if (constant)
          return toName;
        return renderWithCallee(ctx, toName);
      };

      unsigned toMask = *getRelationTruthMask(to);
      op.equivalence = EquivalenceRule{
          "relation between numeric literals keeps its result",
          [fromMask, toMask](const MatchContext &ctx) {
            auto operands = ctx.getOperands();
            if (operands.size() != 2)
              return false;
            auto lhs = getInteger(operands[0]);
            auto rhs = getInteger(operands[1]);
            if (!lhs || !rhs)
              return false;
            return evaluateRelation(fromMask, *lhs, *rhs) ==
                   evaluateRelation(toMask, *lhs, *rhs);
          }};
      ops.push_back(std::move(op));
    }
  }
}

/// An operator replacing the callee `from` by `to`.
static Operator makeCalleeSwap(StringRef prefix, OperatorCategory category,
                               StringRef from, StringRef to, double hardness,
                               unsigned minOperands) {
  Operator op;
  op.id = (prefix + "." + from + "->" + to).str();
  op.category = category;
  op.family = op.id;
  op.hardness = hardness;
  std::string fromName = from.str();
  std::string toName = to.str();
  op.matches = [fromName, minOperands](const MatchContext &ctx) {
    return isCallTo(ctx, fromName) && ctx.getOperands().size() >= minOperands;
  };
  op.generate = [toName](const MatchContext &ctx) {
    return renderWithCallee(ctx, toName);
  };
  return op;
}

static void addArithmeticOperators(std::vector<Operator> &ops) {
  EquivalenceRule addZero{
      "add/subtract zero",
      [](const MatchContext &ctx) { return hasTrailingLiteral(ctx, 0); }};
  EquivalenceRule mulOne{
      "multiply/divide by one",
      [](const MatchContext &ctx) { return hasTrailingLiteral(ctx, 1); }};

  auto add = [&](StringRef from, StringRef to,
                 std::optional<EquivalenceRule> rule) {
    Operator op = makeCalleeSwap("aor", OperatorCategory::Arithmetic, from, to,
                                 0.5, 1);
    op.equivalence = std::move(rule);
    ops.push_back(std::move(op));
  };
  add("+", "-", addZero);
  add("-", "+", addZero);
  add("*", "/", mulOne);
  add("/", "*", mulOne);
  add("inc", "dec", std::nullopt);
  add("dec", "inc", std::nullopt);
}

static void addLogicalOperators(std::vector<Operator> &ops) {
  EquivalenceRule identical{"connector over identical operands",
                            allOperandsIdentical};
  for (auto [from, to] : {std::pair<StringRef, StringRef>{"and", "or"},
                          std::pair<StringRef, StringRef>{"or", "and"}}) {
    Operator op =
        makeCalleeSwap("lcr", OperatorCategory::Logical, from, to, 0.5, 1);
    op.equivalence = identical;
    ops.push_back(std::move(op));
  }
}

static void addConditionalOperators(std::vector<Operator> &ops) {
  ops.push_back(makeCalleeSwap("cond", OperatorCategory::Conditional, "if",
                               "if-not", 0.2, 2));
  ops.push_back(makeCalleeSwap("cond", OperatorCategory::Conditional,
                               "if-not", "if", 0.2, 2));
  ops.push_back(makeCalleeSwap("cond", OperatorCategory::Conditional, "when",
                               "when-not", 0.2, 1));
  ops.push_back(makeCalleeSwap("cond", OperatorCategory::Conditional,
                               "when-not", "when", 0.2, 1));
}

static void addNegationOperators(std::vector<Operator> &ops) {
  Operator op;
  op.id = "uoi.remove-not";
  op.category = OperatorCategory::Negation;
  op.family = op.id;
  op.hardness = 0.4;
  op.matches = [](const MatchContext &ctx) {
    return isCallTo(ctx, "not") && ctx.getOperands().size() == 1;
  };
  op.generate = [](const MatchContext &ctx) -> std::optional<std::string> {
    auto operands = ctx.getOperands();
    if (operands.size() != 1)
      return std::nullopt;
    return operands.front()->toString();
  };
  ops.push_back(std::move(op));
}

static void addLiteralOperators(std::vector<Operator> &ops) {
  for (auto [from, to] : {std::pair<StringRef, StringRef>{"true", "false"},
                          std::pair<StringRef, StringRef>{"false", "true"}}) {
    Operator op;
    op.id = ("lit." + from + "->" + to).str();
    op.category = OperatorCategory::Literal;
    op.family = op.id;
    op.hardness = 0.3;
    std::string fromName = from.str();
    std::string toName = to.str();
    op.matches = [fromName](const MatchContext &ctx) {
      auto *token = dyn_cast<TokenNode>(ctx.node);
      return token && token->isSymbol(fromName);
    };
    op.generate = [toName](const MatchContext &) -> std::optional<std::string> {
      return toName;
    };
    ops.push_back(std::move(op));
  }
}

static void addConstantOperators(std::vector<Operator> &ops) {
  Operator increment;
  increment.id = "crp.num->inc";
  increment.category = OperatorCategory::Constant;
  increment.family = increment.id;
  increment.hardness = 0.6;
  increment.matches = [](const MatchContext &ctx) {
    auto value = getInteger(ctx.node);
    return value && *value != std::numeric_limits<int64_t>::max();
  };
  increment.generate =
      [](const MatchContext &ctx) -> std::optional<std::string> {
    auto value = getInteger(ctx.node);
    if (!value || *value == std::numeric_limits<int64_t>::max())
      return std::nullopt;
    return renderIntegerLike(ctx.node, *value + 1);
  };
  ops.push_back(std::move(increment));

  Operator zero;
  zero.id = "crp.num->zero";
  zero.category = OperatorCategory::Constant;
  zero.family = zero.id;
  zero.hardness = 0.4;
  zero.matches = [](const MatchContext &ctx) {
    auto value = getInteger(ctx.node);
    return value && *value != 0;
  };
  zero.generate = [](const MatchContext &ctx) -> std::optional<std::string> {
    return renderIntegerLike(ctx.node, 0);
  };
  ops.push_back(std::move(zero));

  Operator emptyString;
  emptyString.id = "crp.str->empty";
  emptyString.category = OperatorCategory::Constant;
  emptyString.family = emptyString.id;
  emptyString.hardness = 0.5;
  emptyString.matches = [](const MatchContext &ctx) {
    auto *token = dyn_cast<TokenNode>(ctx.node);
    return token && token->getTokenKind() == TokenKind::String &&
           token->getText() != "\"\"";
  };
  emptyString.generate =
      [](const MatchContext &) -> std::optional<std::string> {
    return std::string("\"\"");
  };
  ops.push_back(std::move(emptyString));
}

static void addCollectionOperators(std::vector<Operator> &ops) {
  EquivalenceRule singleton{
      "selector over a single-element vector", [](const MatchContext &ctx) {
        auto operands = ctx.getOperands();
        if (operands.size() != 1)
          return false;
        auto *vec = dyn_cast<SeqNode>(operands.front());
        return vec && vec->getSeqKind() == SeqKind::Vector &&
               vec->getNumSignificant() == 1;
      }};
  EquivalenceRule identical{"extremum over identical operands",
                            allOperandsIdentical};

  auto add = [&](StringRef from, StringRef to, const EquivalenceRule &rule) {
    Operator op = makeCalleeSwap("coll", OperatorCategory::Collection, from,
                                 to, 0.5, 1);
    op.equivalence = rule;
    ops.push_back(std::move(op));
  };
  add("first", "last", singleton);
  add("last", "first", singleton);
  add("min", "max", identical);
  add("max", "min", identical);
}

std::vector<Operator> mutagen::getBuiltinOperators() {
  std::vector<Operator> ops;
  addRelationalOperators(ops);
  addArithmeticOperators(ops);
  addLogicalOperators(ops);
  addConditionalOperators(ops);
  addNegationOperators(ops);
  addLiteralOperators(ops);
  addConstantOperators(ops);
  addCollectionOperators(ops);
  return ops;
}
