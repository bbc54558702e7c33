// transform.hpp
#ifndef OT_TRANSFORM_HPP
#define OT_TRANSFORM_HPP

#include "text_operation.hpp"

#include <utility>
#include <vector>

/// Transforms `a` against `b`, where both were produced against the same
/// document state and `b` has already been applied.
///
/// The result `a'` satisfies the convergence property: applying `b` then `a'`
/// gives the same text as applying `a` then `transform(b, a)`.
///
/// Rules:
/// - Insert vs Insert at the same position: the lower tie-break key goes first.
/// - Insert vs Delete: the insert moves back by the deleted units before it; an
///   insert strictly inside the deleted range is absorbed and becomes a Retain.
/// - Delete vs Insert: an insert at or before the delete shifts it right; an
///   insert strictly inside the range grows the delete so the text is removed.
/// - Delete vs Delete: the overlapping span is removed only once; a delete that
///   loses its whole range becomes a Retain.
/// - Replace behaves as a delete of its range followed by an insert of its text
///   at the start of that range. A Replace that loses its whole range keeps its
///   text as an Insert, unless the range was strictly inside the other delete.
///
/// The function is pure: neither argument is modified.
TextOperation transform(const TextOperation &a, const TextOperation &b);

/// Rebases `op` over already applied operations, folding left in order.
/// `project` maps an element of the range to the `TextOperation` it holds.
template <typename Iterator, typename Projection>
TextOperation rebase(TextOperation op, Iterator first, Iterator last, Projection project) {
  for (; first != last; ++first) {
    op = transform(op, project(*first));
  }
  return op;
}

inline TextOperation rebase(TextOperation op, const std::vector<TextOperation> &applied) {
  return rebase(std::move(op), applied.begin(), applied.end(), [](const TextOperation &o) -> const TextOperation & {
    return o;
  });
}

/// Returns true if `a` goes before `b` when both insert text at the same point
inline bool precedes(const TextOperation &a, const TextOperation &b) { return a.tie_break_key() < b.tie_break_key(); }

#endif // OT_TRANSFORM_HPP
