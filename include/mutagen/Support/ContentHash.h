//===- ContentHash.h - Content digests --------------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Digests used for change detection (forms, test-unit dependencies) and for
// coordinate segments of unordered collections.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_SUPPORT_CONTENTHASH_H
#define MUTAGEN_SUPPORT_CONTENTHASH_H

#include "mutagen/Support/LLVM.h"
#include "llvm/Support/Error.h"
#include <cstdint>
#include <optional>
#include <string>

namespace mutagen {

/// A 128-bit content hash, the leading half of a SHA-256 digest.
struct ContentHash {
  uint64_t high = 0;
  uint64_t low = 0;

  ContentHash() = default;
  ContentHash(uint64_t h, uint64_t l) : high(h), low(l) {}

  bool operator==(const ContentHash &other) const {
    return high == other.high && low == other.low;
  }
  bool operator!=(const ContentHash &other) const { return !(*this == other); }
  bool operator<(const ContentHash &other) const {
    return high < other.high || (high == other.high && low < other.low);
  }

  bool isZero() const { return high == 0 && low == 0; }

  /// Hash a string.
  static ContentHash fromString(StringRef str);

  /// Hash the content of a file.
  static llvm::Expected<ContentHash> fromFile(StringRef path);

  /// Combine two hashes. Order matters.
  ContentHash combine(const ContentHash &other) const;

  /// 32 lowercase hex digits.
  std::string toHexString() const;

  /// Parse the output of toHexString.
  static std::optional<ContentHash> fromHexString(StringRef hex);
};

/// Fast 64-bit digest of `text` (xxHash64), used for coordinate segments.
uint64_t digest64(StringRef text);

/// Format a 64-bit digest as 16 lowercase hex digits.
std::string formatDigest64(uint64_t digest);

} // namespace mutagen

#endif // MUTAGEN_SUPPORT_CONTENTHASH_H
