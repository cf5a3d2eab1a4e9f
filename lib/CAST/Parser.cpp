//===- Parser.cpp - Formatting-preserving reader --------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/CAST/Parser.h"
#include "mutagen/Support/MutagenError.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Debug.h"

#define DEBUG_TYPE "mutagen-cast"

using namespace mutagen;

static bool isWhitespace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v' || c == ',';
}

static bool isCloser(char c) { return c == ')' || c == ']' || c == '}'; }

/// Characters that end an atom.
static bool isDelimiter(char c) {
  switch (c) {
  case '(':
  case ')':
  case '[':
  case ']':
  case '{':
  case '}':
  case '"':
  case ';':
  case '`':
  case '~':
  case '^':
  case '@':
  case '\\':
    return true;
  default:
    return isWhitespace(c);
  }
}

namespace {

class Parser {
public:
  Parser(StringRef text, StringRef bufferName)
      : text(text), bufferName(bufferName) {}

  llvm::Expected<NodePtr> parseDocument();

private:
  bool atEnd() const { return pos >= text.size(); }
  char peek(size_t ahead = 0) const {
    return pos + ahead < text.size() ? text[pos + ahead] : '\0';
  }

  /// Parse the next node, trivia included.
  llvm::Expected<NodePtr> parseNext();

  /// Parse children up to and including `closer`.
  llvm::Error parseChildren(std::vector<NodePtr> &children, char closer,
                            size_t openOffset);

  llvm::Expected<NodePtr> parseSeq(SeqKind kind, size_t openLength,
                                   char closer);
  llvm::Expected<NodePtr> parseAssoc(AssocKind kind, size_t openLength);
  llvm::Expected<NodePtr> parsePrefixed(PrefixKind kind, size_t prefixLength);
  llvm::Expected<NodePtr> parseDispatch();

  NodePtr lexWhitespace();
  NodePtr lexLineComment();
  llvm::Expected<NodePtr> lexString(TokenKind kind, size_t prefixLength);
  llvm::Expected<NodePtr> lexCharacter();
  NodePtr lexAtom();

  llvm::Error error(size_t offset, const Twine &message) const;

  StringRef text;
  StringRef bufferName;
  size_t pos = 0;
};

} // namespace

llvm::Error Parser::error(size_t offset, const Twine &message) const {
  StringRef before = text.take_front(offset);
  unsigned line = before.count('\n') + 1;
  size_t lastNewline = before.rfind('\n');
  unsigned column = lastNewline == StringRef::npos
                        ? offset + 1
                        : offset - lastNewline;
  return makeError(ErrorKind::ParseError, bufferName + ":" + Twine(line) +
                                              ":" + Twine(column) + ": " +
                                              message);
}

llvm::Expected<NodePtr> Parser::parseDocument() {
  std::vector<NodePtr> children;
  while (!atEnd()) {
    if (isCloser(peek()))
      return error(pos, Twine("unmatched '") + Twine(peek()) + "'");
    auto child = parseNext();
    if (!child)
      return child.takeError();
    children.push_back(std::move(*child));
  }
  LLVM_DEBUG(llvm::dbgs() << "parsed " << bufferName << ": " << children.size()
                          << " top-level nodes\n");
  return std::make_shared<SeqNode>(SeqKind::Root, "", "", std::move(children));
}

llvm::Error Parser::parseChildren(std::vector<NodePtr> &children, char closer,
                                  size_t openOffset) {
  while (true) {
    if (atEnd())
      return error(openOffset, Twine("unterminated collection, expected '") +
                                   Twine(closer) + "'");
    char c = peek();
    if (isCloser(c)) {
      if (c != closer)
        return error(pos, Twine("unmatched '") + Twine(c) + "', expected '" +
                              Twine(closer) + "'");
      ++pos;
      return llvm::Error::success();
    }
    auto child = parseNext();
    if (!child)
      return child.takeError();
    children.push_back(std::move(*child));
  }
}

llvm::Expected<NodePtr> Parser::parseNext() {
  char c = peek();
  if (isWhitespace(c))
    return lexWhitespace();
  switch (c) {
  case ';':
    return lexLineComment();
  case '(':
    return parseSeq(SeqKind::List, 1, ')');
  case '[':
    return parseSeq(SeqKind::Vector, 1, ']');
  case '{':
    return parseAssoc(AssocKind::Map, 1);
  case '"':
    return lexString(TokenKind::String, 0);
  case '\\':
    return lexCharacter();
  case '\'':
    return parsePrefixed(PrefixKind::Quote, 1);
  case '`':
    return parsePrefixed(PrefixKind::SyntaxQuote, 1);
  case '~':
    if (peek(1) == '@')
      return parsePrefixed(PrefixKind::UnquoteSplicing, 2);
    return parsePrefixed(PrefixKind::Unquote, 1);
  case '@':
    return parsePrefixed(PrefixKind::Deref, 1);
  case '^':
    return parsePrefixed(PrefixKind::Meta, 1);
  case '#':
    return parseDispatch();
  default:
    return lexAtom();
  }
}

llvm::Expected<NodePtr> Parser::parseSeq(SeqKind kind, size_t openLength,
                                         char closer) {
  size_t start = pos;
  pos += openLength;
  std::vector<NodePtr> children;
  if (auto err = parseChildren(children, closer, start))
    return std::move(err);
  return std::make_shared<SeqNode>(kind, text.substr(start, openLength).str(),
                                   std::string(1, closer),
                                   std::move(children));
}

llvm::Expected<NodePtr> Parser::parseAssoc(AssocKind kind, size_t openLength) {
  size_t start = pos;
  pos += openLength;
  std::vector<NodePtr> children;
  if (auto err = parseChildren(children, '}', start))
    return std::move(err);
  return std::make_shared<AssocNode>(
      kind, text.substr(start, openLength).str(), std::move(children));
}

llvm::Expected<NodePtr> Parser::parsePrefixed(PrefixKind kind,
                                              size_t prefixLength) {
  size_t start = pos;
  pos += prefixLength;
  StringRef prefix = text.substr(start, prefixLength);
  std::vector<NodePtr> children;
  unsigned needed = getPrefixArity(kind);
  while (needed) {
    if (atEnd() || isCloser(peek()))
      return error(start, Twine("missing form after '") + prefix + "'");
    auto child = parseNext();
    if (!child)
      return child.takeError();
    if (!(*child)->isTrivia())
      --needed;
    children.push_back(std::move(*child));
  }
  return std::make_shared<QuotedNode>(kind, prefix.str(), std::move(children));
}

llvm::Expected<NodePtr> Parser::parseDispatch() {
  size_t start = pos;
  char next = peek(1);
  switch (next) {
  case '{':
    return parseAssoc(AssocKind::Set, 2);
  case '(':
    return parseSeq(SeqKind::FnLiteral, 2, ')');
  case '"':
    return lexString(TokenKind::Regex, 1);
  case '_':
    return parsePrefixed(PrefixKind::Discard, 2);
  case '\'':
    return parsePrefixed(PrefixKind::Var, 2);
  case '=':
    return parsePrefixed(PrefixKind::Eval, 2);
  case '^':
    return parsePrefixed(PrefixKind::Meta, 2);
  case '!':
    return lexLineComment();
  case '#':
    // Symbolic values such as ##Inf.
    return lexAtom();
  case '?': {
    size_t openLength = peek(2) == '@' ? 4 : 3;
    if (peek(openLength - 1) != '(')
      return error(start, "reader conditional must be followed by a list");
    return parseSeq(SeqKind::ReaderConditional, openLength, ')');
  }
  case ':': {
    // Namespaced map: #:ns{...} or #::{...}.
    size_t length = 2;
    while (pos + length < text.size() && !isDelimiter(text[pos + length]))
      ++length;
    if (peek(length) != '{')
      return error(start, "namespaced map prefix must be followed by '{'");
    return parseAssoc(AssocKind::Map, length + 1);
  }
  default:
    break;
  }
  if (next == '\0' || isDelimiter(next))
    return error(start, "unsupported dispatch macro");
  // Tagged literal: the tag symbol and the tagged form are both children.
  return parsePrefixed(PrefixKind::Tagged, 1);
}

NodePtr Parser::lexWhitespace() {
  size_t start = pos;
  while (!atEnd() && isWhitespace(peek()))
    ++pos;
  return std::make_shared<TokenNode>(TokenKind::Whitespace,
                                     text.slice(start, pos).str());
}

NodePtr Parser::lexLineComment() {
  size_t start = pos;
  while (!atEnd() && peek() != '\n')
    ++pos;
  return std::make_shared<TokenNode>(TokenKind::Comment,
                                     text.slice(start, pos).str());
}

llvm::Expected<NodePtr> Parser::lexString(TokenKind kind,
                                          size_t prefixLength) {
  size_t start = pos;
  pos += prefixLength + 1;
  while (true) {
    if (atEnd())
      return error(start, "unterminated string");
    char c = peek();
    ++pos;
    if (c == '\\') {
      if (atEnd())
        return error(start, "unterminated string");
      ++pos;
      continue;
    }
    if (c == '"')
      break;
  }
  return std::make_shared<TokenNode>(kind, text.slice(start, pos).str());
}

llvm::Expected<NodePtr> Parser::lexCharacter() {
  size_t start = pos;
  ++pos;
  if (atEnd())
    return error(start, "incomplete character literal");
  // Named characters (\newline, A) continue with alphanumerics.
  bool named = llvm::isAlnum(peek());
  ++pos;
  if (named)
    while (!atEnd() && llvm::isAlnum(peek()))
      ++pos;
  return std::make_shared<TokenNode>(TokenKind::Character,
                                     text.slice(start, pos).str());
}

NodePtr Parser::lexAtom() {
  size_t start = pos;
  ++pos;
  while (!atEnd() && !isDelimiter(peek()))
    ++pos;
  StringRef atom = text.slice(start, pos);

  TokenKind kind = TokenKind::Symbol;
  if (atom.front() == ':')
    kind = TokenKind::Keyword;
  else if (llvm::isDigit(atom.front()) ||
           (atom.size() > 1 && (atom.front() == '+' || atom.front() == '-') &&
            llvm::isDigit(atom[1])))
    kind = TokenKind::Number;
  return std::make_shared<TokenNode>(kind, atom.str());
}

//===----------------------------------------------------------------------===//
// Entry points
//===----------------------------------------------------------------------===//

llvm::Expected<NodePtr> mutagen::parseSource(StringRef text,
                                             StringRef bufferName) {
  Parser parser(text, bufferName);
  return parser.parseDocument();
}

llvm::Expected<NodePtr> mutagen::parseFragment(StringRef text) {
  auto root = parseSource(text, "<fragment>");
  if (!root)
    return root.takeError();
  auto *seq = cast<SeqNode>(root->get());
  auto significant = seq->getSignificantIndices();
  if (significant.size() != 1)
    return makeError(ErrorKind::ParseError,
                     "expected exactly one form in '" + text + "', found " +
                         Twine(significant.size()));
  return seq->getChildren()[significant.front()];
}
