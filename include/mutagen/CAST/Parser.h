//===- Parser.h - Formatting-preserving reader ------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Reads s-expression source into a tree of Nodes. Whitespace, commas and
// comments are preserved as trivia tokens so that rendering the result
// reproduces the input byte for byte.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_CAST_PARSER_H
#define MUTAGEN_CAST_PARSER_H

#include "mutagen/CAST/Node.h"
#include "llvm/Support/Error.h"

namespace mutagen {

/// Parse a whole source buffer. The result is a SeqNode of kind Root.
/// Failures are ParseError values whose message starts with
/// "<bufferName>:<line>:<column>:".
llvm::Expected<NodePtr> parseSource(StringRef text,
                                    StringRef bufferName = "<input>");

/// Parse text that must contain exactly one significant form, optionally
/// surrounded by trivia, and return that form.
llvm::Expected<NodePtr> parseFragment(StringRef text);

} // namespace mutagen

#endif // MUTAGEN_CAST_PARSER_H
