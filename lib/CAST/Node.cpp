//===- Node.cpp - Formatting-preserving syntax tree nodes -----------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/CAST/Node.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"
#include <limits>

using namespace mutagen;

//===----------------------------------------------------------------------===//
// Node
//===----------------------------------------------------------------------===//

Node::~Node() = default;

bool Node::isTrivia() const {
  auto *token = dyn_cast<TokenNode>(this);
  if (!token)
    return false;
  return token->getTokenKind() == TokenKind::Whitespace ||
         token->getTokenKind() == TokenKind::Comment;
}

void Node::render(llvm::raw_ostream &os) const {
  if (auto *token = dyn_cast<TokenNode>(this)) {
    os << token->getText();
    return;
  }
  auto *composite = cast<CompositeNode>(this);
  os << composite->getOpen();
  for (const NodePtr &child : composite->getChildren())
    child->render(os);
  os << composite->getClose();
}

std::string Node::toString() const {
  std::string result;
  llvm::raw_string_ostream os(result);
  render(os);
  os.flush();
  return result;
}

/// Append `node` to `out`. `pendingSpace` records trivia seen since the last
/// significant text.
static void appendCanonical(const Node &node, std::string &out,
                            bool &pendingSpace) {
  if (node.isTrivia()) {
    pendingSpace = true;
    return;
  }
  if (pendingSpace && !out.empty())
    out += ' ';
  pendingSpace = false;

  if (auto *token = dyn_cast<TokenNode>(&node)) {
    out += token->getText().str();
    return;
  }

  auto *composite = cast<CompositeNode>(&node);
  out += composite->getOpen().str();
  bool seenSignificant = false;
  for (const NodePtr &child : composite->getChildren()) {
    // Leading trivia inside a collection never produces a space.
    if (!seenSignificant && child->isTrivia())
      continue;
    seenSignificant = true;
    appendCanonical(*child, out, pendingSpace);
  }
  pendingSpace = false;
  out += composite->getClose().str();
}

std::string Node::canonicalText() const {
  std::string result;
  bool pendingSpace = false;
  appendCanonical(*this, result, pendingSpace);
  return result;
}

unsigned Node::countNewlines() const {
  if (auto *token = dyn_cast<TokenNode>(this))
    return token->getText().count('\n');
  auto *composite = cast<CompositeNode>(this);
  unsigned count =
      composite->getOpen().count('\n') + composite->getClose().count('\n');
  for (const NodePtr &child : composite->getChildren())
    count += child->countNewlines();
  return count;
}

//===----------------------------------------------------------------------===//
// TokenNode
//===----------------------------------------------------------------------===//

std::optional<int64_t> TokenNode::getIntegerValue() const {
  if (tokenKind != TokenKind::Number)
    return std::nullopt;
  StringRef digits = text;
  digits.consume_back("N");
  bool negative = false;
  if (digits.consume_front("-"))
    negative = true;
  else
    digits.consume_front("+");
  if (digits.empty() ||
      !llvm::all_of(digits, [](char c) { return llvm::isDigit(c); }))
    return std::nullopt;
  uint64_t magnitude;
  if (digits.getAsInteger(10, magnitude) ||
      magnitude > uint64_t(std::numeric_limits<int64_t>::max()))
    return std::nullopt;
  return negative ? -int64_t(magnitude) : int64_t(magnitude);
}

//===----------------------------------------------------------------------===//
// CompositeNode
//===----------------------------------------------------------------------===//

SmallVector<unsigned, 8> CompositeNode::getSignificantIndices() const {
  SmallVector<unsigned, 8> indices;
  for (unsigned i = 0, e = children.size(); i != e; ++i)
    if (!children[i]->isTrivia())
      indices.push_back(i);
  return indices;
}

unsigned CompositeNode::getNumSignificant() const {
  return llvm::count_if(
      children, [](const NodePtr &child) { return !child->isTrivia(); });
}

const Node *CompositeNode::getSignificant(unsigned ordinal) const {
  for (const NodePtr &child : children) {
    if (child->isTrivia())
      continue;
    if (ordinal == 0)
      return child.get();
    --ordinal;
  }
  return nullptr;
}

unsigned CompositeNode::getOrdinalOf(unsigned rawIndex) const {
  unsigned ordinal = 0;
  for (unsigned i = 0; i < rawIndex && i < children.size(); ++i)
    if (!children[i]->isTrivia())
      ++ordinal;
  return ordinal;
}

//===----------------------------------------------------------------------===//
// SeqNode
//===----------------------------------------------------------------------===//

std::optional<StringRef> SeqNode::getHeadSymbol() const {
  if (seqKind != SeqKind::List)
    return std::nullopt;
  auto *head = dyn_cast_or_null<TokenNode>(getSignificant(0));
  if (!head || head->getTokenKind() != TokenKind::Symbol)
    return std::nullopt;
  return head->getText();
}

NodePtr SeqNode::withChildren(std::vector<NodePtr> newChildren) const {
  return std::make_shared<SeqNode>(seqKind, getOpen().str(), getClose().str(),
                                   std::move(newChildren));
}

//===----------------------------------------------------------------------===//
// AssocNode
//===----------------------------------------------------------------------===//

std::string AssocNode::getAddressText(unsigned ordinal) const {
  const Node *child = getSignificant(ordinal);
  if (!child)
    return {};
  if (assocKind == AssocKind::Set)
    return "e" + child->canonicalText();
  if (ordinal % 2 == 0)
    return "k" + child->canonicalText();
  // A value is addressed through its key.
  return "v" + getSignificant(ordinal - 1)->canonicalText();
}

NodePtr AssocNode::withChildren(std::vector<NodePtr> newChildren) const {
  return std::make_shared<AssocNode>(assocKind, getOpen().str(),
                                     std::move(newChildren));
}

//===----------------------------------------------------------------------===//
// QuotedNode
//===----------------------------------------------------------------------===//

unsigned mutagen::getPrefixArity(PrefixKind kind) {
  return kind == PrefixKind::Meta || kind == PrefixKind::Tagged ? 2 : 1;
}

const Node *QuotedNode::getTarget() const {
  unsigned count = getNumSignificant();
  return count ? getSignificant(count - 1) : nullptr;
}

NodePtr QuotedNode::withChildren(std::vector<NodePtr> newChildren) const {
  return std::make_shared<QuotedNode>(prefixKind, getOpen().str(),
                                      std::move(newChildren));
}

//===----------------------------------------------------------------------===//
// QuoteDepth
//===----------------------------------------------------------------------===//

QuoteDepth QuoteDepth::enter(PrefixKind kind) const {
  QuoteDepth result = *this;
  if (quoted)
    return result;
  switch (kind) {
  case PrefixKind::Quote:
    if (syntaxDepth == 0)
      result.quoted = true;
    break;
  case PrefixKind::SyntaxQuote:
    ++result.syntaxDepth;
    break;
  case PrefixKind::Unquote:
  case PrefixKind::UnquoteSplicing:
    if (result.syntaxDepth > 0)
      --result.syntaxDepth;
    break;
  case PrefixKind::Discard:
    result.discarded = true;
    break;
  case PrefixKind::Deref:
  case PrefixKind::Var:
  case PrefixKind::Meta:
  case PrefixKind::Eval:
  case PrefixKind::Tagged:
    break;
  }
  return result;
}
