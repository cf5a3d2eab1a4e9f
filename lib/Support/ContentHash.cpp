//===- ContentHash.cpp - Content digests ----------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Support/ContentHash.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/SHA256.h"
#include "llvm/Support/xxhash.h"

using namespace mutagen;

static uint64_t readBigEndian64(const uint8_t *bytes) {
  uint64_t value = 0;
  for (unsigned i = 0; i < 8; ++i)
    value = (value << 8) | bytes[i];
  return value;
}

ContentHash ContentHash::fromString(StringRef str) {
  auto digest = llvm::SHA256::hash(llvm::arrayRefFromStringRef(str));
  return ContentHash(readBigEndian64(digest.data()),
                     readBigEndian64(digest.data() + 8));
}

llvm::Expected<ContentHash> ContentHash::fromFile(StringRef path) {
  auto bufferOrErr = llvm::MemoryBuffer::getFile(path);
  if (!bufferOrErr)
    return llvm::createStringError(bufferOrErr.getError(),
                                   "failed to read '%s' for hashing",
                                   path.str().c_str());
  return fromString((*bufferOrErr)->getBuffer());
}

ContentHash ContentHash::combine(const ContentHash &other) const {
  return fromString(toHexString() + other.toHexString());
}

std::string ContentHash::toHexString() const {
  return formatDigest64(high) + formatDigest64(low);
}

std::optional<ContentHash> ContentHash::fromHexString(StringRef hex) {
  if (hex.size() != 32)
    return std::nullopt;
  uint64_t h = 0, l = 0;
  if (hex.substr(0, 16).getAsInteger(16, h) ||
      hex.substr(16).getAsInteger(16, l))
    return std::nullopt;
  return ContentHash(h, l);
}

uint64_t mutagen::digest64(StringRef text) { return llvm::xxHash64(text); }

std::string mutagen::formatDigest64(uint64_t digest) {
  std::string hex = llvm::utohexstr(digest, /*LowerCase=*/true);
  if (hex.size() < 16)
    hex.insert(0, 16 - hex.size(), '0');
  return hex;
}
