// transform.cpp
#include "transform.hpp"

#include <algorithm>

namespace {

/// Where an operation's insertion point sits relative to the text of a
/// concurrent operation that lands on the same point.
enum class Anchor {
  Before, // came from at or before the start of the other's deleted range
  After,  // came from the end of the other's deleted range
  Tie     // anchored identically, ordered by tie-break key
};

} // namespace

TextOperation transform(const TextOperation &a, const TextOperation &b) {
  if (b.is_noop()) {
    return a;
  }

  const uint64_t q = b.position();
  const uint64_t removed = b.removed_length();
  const uint64_t inserted = b.inserted_length();
  const uint64_t b_end = q + removed;

  OperationKind kind = a.kind();
  uint64_t p = a.position();
  uint64_t len = a.removed_length();
  Anchor anchor = Anchor::Tie;

  // Step 1: move `a` across the range `b` deleted.
  if (removed > 0) {
    if (len == 0) {
      if (p <= q) {
        anchor = Anchor::Before;
      } else if (p >= b_end) {
        p -= removed;
        anchor = Anchor::After;
      } else {
        // Strictly inside the deleted range. The insert's text would have been
        // removed by `b` on the other replica.
        return a.rebased_as(OperationKind::Retain, q, 0);
      }
    } else {
      const uint64_t a_end = p + len;
      if (a_end <= q) {
        // Entirely before the deleted range
      } else if (p >= b_end) {
        p -= removed;
      } else {
        // The overlap has already been removed by `b`. Whichever side holds the
        // lower tie-break key owns it, and in both orders it is deleted once.
        const uint64_t overlap = std::min(a_end, b_end) - std::max(p, q);
        const bool strictly_covered = p > q && a_end < b_end;
        const bool starts_together = p == q;
        const bool ends_together = a_end == b_end;
        p = std::min(p, q);
        len -= overlap;

        if (len == 0) {
          if (kind == OperationKind::Delete || strictly_covered) {
            return a.rebased_as(OperationKind::Retain, p, 0);
          }
          // A Replace whose range vanished still contributes its text.
          kind = OperationKind::Insert;
          if (starts_together && ends_together) {
            anchor = Anchor::Tie;
          } else if (starts_together) {
            anchor = Anchor::Before;
          } else {
            anchor = Anchor::After;
          }
        }
      }
    }
  }

  // Step 2: move `a` across the text `b` inserted at `q`.
  if (inserted > 0) {
    if (len > 0) {
      if (q <= p) {
        p += inserted;
      } else if (q < p + len) {
        // Text landed inside the range: the delete absorbs it.
        len += inserted;
      }
    } else if (q < p) {
      p += inserted;
    } else if (q == p) {
      bool shift = false;
      switch (anchor) {
      case Anchor::Before:
        shift = false;
        break;
      case Anchor::After:
        shift = true;
        break;
      case Anchor::Tie:
        shift = kind == OperationKind::Retain || precedes(b, a);
        break;
      }
      if (shift) {
        p += inserted;
      }
    }
  }

  if (kind == a.kind() && p == a.position() && len == a.removed_length()) {
    return a;
  }
  return a.rebased_as(kind, p, len);
}
