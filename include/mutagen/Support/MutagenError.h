//===- MutagenError.h - Typed engine errors ---------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file defines the error kinds produced by the mutation engine. They are
// carried through llvm::Error / llvm::Expected so callers can inspect the kind
// with llvm::handleErrors or getMutagenErrorKind.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_SUPPORT_MUTAGENERROR_H
#define MUTAGEN_SUPPORT_MUTAGENERROR_H

#include "mutagen/Support/LLVM.h"
#include "llvm/Support/Error.h"
#include <optional>
#include <string>

namespace mutagen {

enum class ErrorKind {
  /// A coordinate no longer resolves in the current tree.
  LocationNotFound,
  /// A digest segment matched more than one child.
  LocationAmbiguous,
  /// The replacement could not be generated or spliced.
  MutationApplyFailure,
  /// A mutated file could not be restored. Fatal for the whole run.
  RevertFailure,
  /// A targeted test exceeded its time bound.
  TestTimeout,
  /// Test execution failed for reasons unrelated to assertions.
  TestError,
  /// Persisted coverage no longer matches its dependency hash.
  IndexStaleness,
  /// Source text could not be parsed.
  ParseError,
  /// Invalid configuration.
  ConfigError,
  /// Invalid operator catalog (bad edge, cyclic family, unknown id).
  CatalogError,
  /// Persisted state is unreadable or has the wrong shape.
  StateError,
};

/// Return the stable name of an error kind ("location-not-found", ...).
StringRef getErrorKindName(ErrorKind kind);

class MutagenError : public llvm::ErrorInfo<MutagenError> {
public:
  static char ID;

  MutagenError(ErrorKind kind, const Twine &message);

  ErrorKind getKind() const { return kind; }
  StringRef getMessage() const { return message; }

  void log(llvm::raw_ostream &os) const override;
  std::error_code convertToErrorCode() const override;

private:
  ErrorKind kind;
  std::string message;
};

/// Create an llvm::Error holding a MutagenError.
llvm::Error makeError(ErrorKind kind, const Twine &message);

/// Return true if the error is fatal for the whole run.
bool isFatal(ErrorKind kind);

/// Consume `err` and return its kind, or std::nullopt if it is not a
/// MutagenError. The message is appended to `message` when non-null.
std::optional<ErrorKind> consumeMutagenError(llvm::Error err,
                                             std::string *message = nullptr);

} // namespace mutagen

#endif // MUTAGEN_SUPPORT_MUTAGENERROR_H
