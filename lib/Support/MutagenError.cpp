//===- MutagenError.cpp - Typed engine errors -----------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Support/MutagenError.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/raw_ostream.h"

using namespace mutagen;

char MutagenError::ID = 0;

StringRef mutagen::getErrorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::LocationNotFound:
    return "location-not-found";
  case ErrorKind::LocationAmbiguous:
    return "location-ambiguous";
  case ErrorKind::MutationApplyFailure:
    return "mutation-apply-failure";
  case ErrorKind::RevertFailure:
    return "revert-failure";
  case ErrorKind::TestTimeout:
    return "test-timeout";
  case ErrorKind::TestError:
    return "test-error";
  case ErrorKind::IndexStaleness:
    return "index-staleness";
  case ErrorKind::ParseError:
    return "parse-error";
  case ErrorKind::ConfigError:
    return "config-error";
  case ErrorKind::CatalogError:
    return "catalog-error";
  case ErrorKind::StateError:
    return "state-error";
  }
  return "unknown";
}

MutagenError::MutagenError(ErrorKind kind, const Twine &message)
    : kind(kind), message(message.str()) {}

void MutagenError::log(llvm::raw_ostream &os) const {
  os << getErrorKindName(kind) << ": " << message;
}

std::error_code MutagenError::convertToErrorCode() const {
  switch (kind) {
  case ErrorKind::LocationNotFound:
    return std::make_error_code(std::errc::no_such_file_or_directory);
  case ErrorKind::TestTimeout:
    return std::make_error_code(std::errc::timed_out);
  case ErrorKind::RevertFailure:
  case ErrorKind::MutationApplyFailure:
    return std::make_error_code(std::errc::io_error);
  default:
    return std::make_error_code(std::errc::invalid_argument);
  }
}

llvm::Error mutagen::makeError(ErrorKind kind, const Twine &message) {
  return llvm::make_error<MutagenError>(kind, message);
}

bool mutagen::isFatal(ErrorKind kind) {
  return kind == ErrorKind::RevertFailure;
}

std::optional<ErrorKind> mutagen::consumeMutagenError(llvm::Error err,
                                                      std::string *message) {
  std::optional<ErrorKind> kind;
  llvm::handleAllErrors(
      std::move(err),
      [&](const MutagenError &e) {
        kind = e.getKind();
        if (message)
          *message += e.getMessage().str();
      },
      [&](const llvm::ErrorInfoBase &e) {
        if (message)
          *message += e.message();
      });
  return kind;
}
