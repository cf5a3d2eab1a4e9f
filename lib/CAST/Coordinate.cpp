//===- Coordinate.cpp - Paths from a form to a descendant -----------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/CAST/Coordinate.h"
#include "mutagen/Support/ContentHash.h"
#include "mutagen/Support/MutagenError.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/Twine.h"

using namespace mutagen;

std::string CoordinateSegment::toString() const {
  if (isOrdinal())
    return llvm::utostr(value);
  return "#" + formatDigest64(value);
}

llvm::Expected<Coordinate> Coordinate::parse(StringRef text) {
  Coordinate result;
  if (text.empty())
    return result;

  SmallVector<StringRef, 8> parts;
  text.split(parts, '/');
  for (StringRef part : parts) {
    if (part.consume_front("#")) {
      uint64_t digest;
      if (part.size() != 16 || part.getAsInteger(16, digest))
        return makeError(ErrorKind::LocationNotFound,
                         "malformed digest segment '#" + part +
                             "' in coordinate '" + text + "'");
      result.push_back(CoordinateSegment::digest(digest));
      continue;
    }
    unsigned ordinal;
    if (part.empty() || part.getAsInteger(10, ordinal))
      return makeError(ErrorKind::LocationNotFound,
                       "malformed ordinal segment '" + part +
                           "' in coordinate '" + text + "'");
    result.push_back(CoordinateSegment::ordinal(ordinal));
  }
  return result;
}

std::string Coordinate::toString() const {
  std::string result;
  for (const auto &segment : segments) {
    if (!result.empty())
      result += '/';
    result += segment.toString();
  }
  return result;
}

Coordinate Coordinate::dropBack(size_t count) const {
  count = std::min(count, segments.size());
  return Coordinate(ArrayRef<CoordinateSegment>(segments).drop_back(count));
}

bool Coordinate::isPrefixOf(const Coordinate &other) const {
  if (segments.size() > other.segments.size())
    return false;
  return std::equal(segments.begin(), segments.end(), other.segments.begin());
}

bool Coordinate::operator<(const Coordinate &other) const {
  return std::lexicographical_compare(segments.begin(), segments.end(),
                                      other.segments.begin(),
                                      other.segments.end());
}
