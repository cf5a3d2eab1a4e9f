//===- Coordinate.h - Paths from a form to a descendant ---------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// A Coordinate addresses a node relative to the root of its top-level form.
// Segments into ordered collections are ordinals over significant children;
// segments into unordered collections are 64-bit content digests, so that a
// reordering of map entries does not move the coordinate.
//
// Text form: segments joined by '/', ordinals in decimal, digests as '#'
// followed by 16 lowercase hex digits, e.g. "2/#00f3a1c0b2d4e5f6/1". The
// empty string is the form itself.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_CAST_COORDINATE_H
#define MUTAGEN_CAST_COORDINATE_H

#include "mutagen/Support/LLVM.h"
#include "llvm/Support/Error.h"
#include <cstdint>
#include <string>

namespace mutagen {

class CoordinateSegment {
public:
  enum class Kind { Ordinal, Digest };

  static CoordinateSegment ordinal(unsigned index) {
    return CoordinateSegment(Kind::Ordinal, index);
  }
  static CoordinateSegment digest(uint64_t value) {
    return CoordinateSegment(Kind::Digest, value);
  }

  Kind getKind() const { return kind; }
  bool isOrdinal() const { return kind == Kind::Ordinal; }
  bool isDigest() const { return kind == Kind::Digest; }
  unsigned getOrdinal() const { return static_cast<unsigned>(value); }
  uint64_t getDigest() const { return value; }

  std::string toString() const;

  bool operator==(const CoordinateSegment &other) const {
    return kind == other.kind && value == other.value;
  }
  bool operator!=(const CoordinateSegment &other) const {
    return !(*this == other);
  }
  bool operator<(const CoordinateSegment &other) const {
    return kind < other.kind || (kind == other.kind && value < other.value);
  }

private:
  CoordinateSegment(Kind kind, uint64_t value) : kind(kind), value(value) {}

  Kind kind;
  uint64_t value;
};

class Coordinate {
public:
  Coordinate() = default;
  explicit Coordinate(ArrayRef<CoordinateSegment> segments)
      : segments(segments.begin(), segments.end()) {}

  /// Parse the text form.
  static llvm::Expected<Coordinate> parse(StringRef text);

  std::string toString() const;

  ArrayRef<CoordinateSegment> getSegments() const { return segments; }
  size_t size() const { return segments.size(); }
  bool empty() const { return segments.empty(); }

  void push_back(CoordinateSegment segment) { segments.push_back(segment); }

  /// The coordinate of the parent node. The parent of the form root is the
  /// form root.
  Coordinate getParent() const { return dropBack(1); }

  /// This coordinate with the last `count` segments removed.
  Coordinate dropBack(size_t count) const;

  /// True if this coordinate addresses `other` or one of its ancestors.
  bool isPrefixOf(const Coordinate &other) const;

  /// True if either coordinate is a prefix of the other.
  bool overlaps(const Coordinate &other) const {
    return isPrefixOf(other) || other.isPrefixOf(*this);
  }

  bool operator==(const Coordinate &other) const {
    return segments == other.segments;
  }
  bool operator!=(const Coordinate &other) const { return !(*this == other); }
  bool operator<(const Coordinate &other) const;

private:
  SmallVector<CoordinateSegment, 8> segments;
};

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os,
                                     const Coordinate &coord) {
  return os << coord.toString();
}

} // namespace mutagen

#endif // MUTAGEN_CAST_COORDINATE_H
