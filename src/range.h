#ifndef CCM_LOOKAHEAD_RANGE_H
#define CCM_LOOKAHEAD_RANGE_H

#include <cstddef>
#include <limits>
#include <optional>

namespace ccm::lookahead {

struct Bound {
   enum class Kind {
      // No limit. As a lower bound this means position 0; as an upper bound it
      // means "everything the source can still produce".
      Unbounded,

      // value is part of the range.
      Included,

      // value is not part of the range.
      Excluded
   };

   Kind kind = Kind::Unbounded;
   std::size_t value = 0;

   static Bound unbounded() { return {Kind::Unbounded, 0}; }
   static Bound included(std::size_t n) { return {Kind::Included, n}; }
   static Bound excluded(std::size_t n) { return {Kind::Excluded, n}; }
};

// Positions are relative to the front of a LookaheadBuffer: 0 is the element
// the next pop() would return.
struct Range {
   Bound start;
   Bound end;
};

inline Range range(std::size_t first, std::size_t last) {
   return {Bound::included(first), Bound::excluded(last)};
}

inline Range rangeInclusive(std::size_t first, std::size_t last) {
   return {Bound::included(first), Bound::included(last)};
}

inline Range rangeFrom(std::size_t first) {
   return {Bound::included(first), Bound::unbounded()};
}

inline Range rangeTo(std::size_t last) {
   return {Bound::unbounded(), Bound::excluded(last)};
}

inline Range rangeToInclusive(std::size_t last) {
   return {Bound::unbounded(), Bound::included(last)};
}

inline Range rangeFull() {
   return {Bound::unbounded(), Bound::unbounded()};
}

// First position covered by the range, or nothing if the lower bound lies
// past every representable position.
inline std::optional<std::size_t> startIndex(const Range &r) {
   switch (r.start.kind) {
   case Bound::Kind::Included:
      return r.start.value;
   case Bound::Kind::Excluded:
      if (r.start.value == std::numeric_limits<std::size_t>::max()) {
         return std::nullopt;
      }
      return r.start.value + 1;
   case Bound::Kind::Unbounded:
      break;
   }
   return 0;
}

// One past the last position covered by the range, or nothing if the range
// has no finite upper limit. An included SIZE_MAX counts as no limit.
inline std::optional<std::size_t> endIndex(const Range &r) {
   switch (r.end.kind) {
   case Bound::Kind::Included:
      if (r.end.value == std::numeric_limits<std::size_t>::max()) {
         return std::nullopt;
      }
      return r.end.value + 1;
   case Bound::Kind::Excluded:
      return r.end.value;
   case Bound::Kind::Unbounded:
      break;
   }
   return std::nullopt;
}

} // namespace ccm::lookahead

#endif
