//===- Operator.cpp - Declarative mutation operators ----------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Mutation/Operator.h"
#include "llvm/Support/ErrorHandling.h"

using namespace mutagen;

StringRef mutagen::getOperatorCategoryName(OperatorCategory category) {
  switch (category) {
  case OperatorCategory::Relational:
    return "relational";
  case OperatorCategory::Arithmetic:
    return "arithmetic";
  case OperatorCategory::Logical:
    return "logical";
  case OperatorCategory::Conditional:
    return "conditional";
  case OperatorCategory::Negation:
    return "negation";
  case OperatorCategory::Literal:
    return "literal";
  case OperatorCategory::Constant:
    return "constant";
  case OperatorCategory::Collection:
    return "collection";
  }
  llvm_unreachable("unknown operator category");
}

const SeqNode *MatchContext::getList() const {
  auto *seq = dyn_cast_or_null<SeqNode>(node);
  if (!seq || seq->getSeqKind() != SeqKind::List)
    return nullptr;
  return seq;
}

std::optional<StringRef> MatchContext::getCallee() const {
  if (const SeqNode *list = getList())
    return list->getHeadSymbol();
  return std::nullopt;
}

SmallVector<const Node *, 4> MatchContext::getOperands() const {
  SmallVector<const Node *, 4> operands;
  const SeqNode *list = getList();
  if (!list)
    return operands;
  for (unsigned i = 1, e = list->getNumSignificant(); i < e; ++i)
    operands.push_back(list->getSignificant(i));
  return operands;
}
