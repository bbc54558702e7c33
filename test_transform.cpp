// test_transform.cpp
// Tests for the pairwise transform rules and the convergence property

#include "transform.hpp"
#include "utf8.hpp"
#include <iostream>
#include <random>
#include <string>

// Helper macro for test assertions
#define TEST_ASSERT(condition, message) \
  do { \
    if (!(condition)) { \
      std::cerr << "FAILED: " << message << "\n"; \
      std::cerr << "  at " << __FILE__ << ":" << __LINE__ << "\n"; \
      return false; \
    } \
  } while (0)

#define RUN_TEST(test_func) \
  do { \
    std::cout << "Running " << #test_func << "... "; \
    if (test_func()) { \
      std::cout << "PASSED\n"; \
      passed++; \
    } else { \
      std::cout << "FAILED\n"; \
      failed++; \
    } \
    total++; \
  } while (0)

// Applies `first` then `second` to `text` and returns the result as UTF-8
static std::string apply_both(const std::string &text, const TextOperation &first, const TextOperation &second) {
  std::u32string content = utf8::decode(text);
  first.apply_to(content);
  second.apply_to(content);
  return utf8::encode(content);
}

// Result of applying b then transform(a, b)
static std::string apply_b_then_a(const std::string &text, const TextOperation &a, const TextOperation &b) {
  return apply_both(text, b, transform(a, b));
}

// Result of applying a then transform(b, a)
static std::string apply_a_then_b(const std::string &text, const TextOperation &a, const TextOperation &b) {
  return apply_both(text, a, transform(b, a));
}

// Insert vs Insert

bool test_insert_after_earlier_insert_shifts() {
  auto a = TextOperation::make_insert(4, "A", "alice", 1, "a");
  auto b = TextOperation::make_insert(1, "BB", "bob", 1, "b");
  auto a2 = transform(a, b);
  TEST_ASSERT(a2.kind() == OperationKind::Insert, "Still an insert");
  TEST_ASSERT(a2.position() == 6, "Shifted by the inserted length");
  TEST_ASSERT(transform(b, a).position() == 1, "Earlier insert is unaffected");
  return true;
}

bool test_insert_tie_lower_logical_time_first() {
  // "ab": A (t=5) and B (t=3) both insert at 2
  auto a = TextOperation::make_insert(2, "A", "alice", 5, "a");
  auto b = TextOperation::make_insert(2, "B", "bob", 3, "b");

  TEST_ASSERT(transform(a, b).position() == 3, "Later logical time is shifted");
  TEST_ASSERT(transform(b, a).position() == 2, "Earlier logical time keeps its position");
  TEST_ASSERT(apply_b_then_a("ab", a, b) == "abBA", "B lands first");
  TEST_ASSERT(apply_a_then_b("ab", a, b) == "abBA", "Same result in the other order");
  return true;
}

bool test_insert_tie_same_time_uses_author() {
  auto a = TextOperation::make_insert(0, "A", "alice", 4, "z-id");
  auto b = TextOperation::make_insert(0, "B", "bob", 4, "a-id");
  TEST_ASSERT(transform(a, b).position() == 0, "alice < bob, alice stays");
  TEST_ASSERT(transform(b, a).position() == 1, "bob shifts");
  TEST_ASSERT(apply_b_then_a("", a, b) == "AB", "alice first");
  TEST_ASSERT(apply_a_then_b("", a, b) == "AB", "alice first in both orders");
  return true;
}

// Insert vs Delete

bool test_insert_after_delete_moves_back() {
  auto a = TextOperation::make_insert(8, "X", "alice", 1, "a");
  auto b = TextOperation::make_delete(2, 3, "bob", 1, "b");
  TEST_ASSERT(transform(a, b).position() == 5, "Moved back by the deleted length");
  return true;
}

bool test_insert_at_delete_start_is_kept() {
  auto a = TextOperation::make_insert(2, "X", "alice", 1, "a");
  auto b = TextOperation::make_delete(2, 3, "bob", 1, "b");
  auto a2 = transform(a, b);
  TEST_ASSERT(a2.kind() == OperationKind::Insert && a2.position() == 2, "Insert at the start survives");
  TEST_ASSERT(apply_b_then_a("0123456", a, b) == "01X56", "Delete then insert");
  TEST_ASSERT(apply_a_then_b("0123456", a, b) == "01X56", "Insert then delete");
  return true;
}

bool test_insert_at_delete_end_is_kept() {
  auto a = TextOperation::make_insert(5, "X", "alice", 1, "a");
  auto b = TextOperation::make_delete(2, 3, "bob", 1, "b");
  auto a2 = transform(a, b);
  TEST_ASSERT(a2.kind() == OperationKind::Insert && a2.position() == 2, "Insert at the end clamps to the start");
  TEST_ASSERT(apply_b_then_a("0123456", a, b) == "01X56", "Delete then insert");
  TEST_ASSERT(apply_a_then_b("0123456", a, b) == "01X56", "Insert then delete");
  return true;
}

bool test_delete_absorbs_insert_inside_range() {
  auto ins = TextOperation::make_insert(4, "XY", "alice", 1, "a");
  auto del = TextOperation::make_delete(2, 5, "bob", 2, "b");

  auto ins2 = transform(ins, del);
  TEST_ASSERT(ins2.kind() == OperationKind::Retain, "Insert inside a deleted range degenerates to a Retain");
  TEST_ASSERT(ins2.position() == 2, "Retain sits at the delete's start");
  TEST_ASSERT(ins2.operation_id() == "a", "Identity is preserved");

  auto del2 = transform(del, ins);
  TEST_ASSERT(del2.kind() == OperationKind::Delete, "Still a delete");
  TEST_ASSERT(del2.position() == 2 && del2.length() == 7, "Delete grows over the inserted text");

  TEST_ASSERT(apply_b_then_a("0123456789", ins, del) == "01789", "Inserted text is gone");
  TEST_ASSERT(apply_a_then_b("0123456789", ins, del) == "01789", "Inserted text is gone in both orders");
  return true;
}

// Delete vs Insert

bool test_delete_after_insert_shifts() {
  auto a = TextOperation::make_delete(3, 2, "alice", 1, "a");
  auto b = TextOperation::make_insert(3, "XYZ", "bob", 1, "b");
  auto a2 = transform(a, b);
  TEST_ASSERT(a2.position() == 6 && a2.length() == 2, "Insert at the delete's start pushes it right");
  TEST_ASSERT(apply_b_then_a("abcdefg", a, b) == "abcXYZfg", "Inserted text survives");
  TEST_ASSERT(apply_a_then_b("abcdefg", a, b) == "abcXYZfg", "Inserted text survives in both orders");
  return true;
}

bool test_delete_before_insert_unchanged() {
  auto a = TextOperation::make_delete(0, 2, "alice", 1, "a");
  auto b = TextOperation::make_insert(2, "X", "bob", 1, "b");
  TEST_ASSERT(transform(a, b) == a, "Insert at the delete's end does not affect it");
  return true;
}

// Delete vs Delete

bool test_overlapping_deletes() {
  // "hello world": A deletes "hello" [0,5), B deletes "lo wo" [3,8)
  auto a = TextOperation::make_delete(0, 5, "alice", 1, "a");
  auto b = TextOperation::make_delete(3, 5, "bob", 2, "b");

  auto b2 = transform(b, a);
  TEST_ASSERT(b2.position() == 0 && b2.length() == 3, "B loses the overlap and deletes [5,8) only");

  auto a2 = transform(a, b);
  TEST_ASSERT(a2.position() == 0 && a2.length() == 3, "A keeps only what B did not already remove");

  TEST_ASSERT(apply_b_then_a("hello world", a, b) == "rld", "B then A");
  TEST_ASSERT(apply_a_then_b("hello world", a, b) == "rld", "A then B");
  return true;
}

bool test_contained_delete_becomes_retain() {
  auto inner = TextOperation::make_delete(3, 2, "alice", 9, "a");
  auto outer = TextOperation::make_delete(1, 6, "bob", 1, "b");

  auto inner2 = transform(inner, outer);
  TEST_ASSERT(inner2.kind() == OperationKind::Retain, "Fully consumed delete degenerates to a Retain");
  TEST_ASSERT(inner2.operation_id() == "a", "Retain keeps the operation id");

  auto outer2 = transform(outer, inner);
  TEST_ASSERT(outer2.position() == 1 && outer2.length() == 4, "Outer shrinks by the inner range");

  TEST_ASSERT(apply_b_then_a("0123456789", inner, outer) == "0789", "Outer then inner");
  TEST_ASSERT(apply_a_then_b("0123456789", inner, outer) == "0789", "Inner then outer");
  return true;
}

bool test_identical_deletes() {
  auto a = TextOperation::make_delete(2, 2, "alice", 1, "a");
  auto b = TextOperation::make_delete(2, 2, "bob", 1, "b");
  TEST_ASSERT(transform(a, b).kind() == OperationKind::Retain, "Second identical delete is a Retain");
  TEST_ASSERT(transform(b, a).kind() == OperationKind::Retain, "In both directions");
  TEST_ASSERT(apply_b_then_a("abcdef", a, b) == "abef", "Removed once");
  return true;
}

bool test_disjoint_deletes_shift() {
  auto a = TextOperation::make_delete(6, 2, "alice", 1, "a");
  auto b = TextOperation::make_delete(1, 3, "bob", 1, "b");
  auto a2 = transform(a, b);
  TEST_ASSERT(a2.position() == 3 && a2.length() == 2, "Later delete shifts left, length unchanged");
  TEST_ASSERT(transform(b, a) == b, "Earlier delete is unaffected");
  return true;
}

// Retain

bool test_retain_is_neutral() {
  auto ret = TextOperation::make_retain(2, "alice", 1, "r");
  auto ins = TextOperation::make_insert(1, "X", "bob", 1, "b");
  TEST_ASSERT(transform(ins, ret) == ins, "Nothing moves across a Retain");
  TEST_ASSERT(transform(ret, ins).position() == 3, "A Retain moves like a cursor");

  auto del = TextOperation::make_delete(0, 5, "bob", 1, "d");
  auto ret2 = transform(ret, del);
  TEST_ASSERT(ret2.is_noop() && ret2.position() == 0, "Cursor inside a deleted range clamps to its start");
  return true;
}

// Replace

bool test_replace_against_insert_inside() {
  auto rep = TextOperation::make_replace(1, 4, "R", "alice", 1, "a");
  auto ins = TextOperation::make_insert(3, "X", "bob", 1, "b");

  auto rep2 = transform(rep, ins);
  TEST_ASSERT(rep2.kind() == OperationKind::Replace && rep2.length() == 5, "Replace absorbs text inside its range");
  TEST_ASSERT(transform(ins, rep).kind() == OperationKind::Retain, "Insert inside a replaced range is absorbed");
  TEST_ASSERT(apply_b_then_a("0123456", rep, ins) == "0R56", "Insert then replace");
  TEST_ASSERT(apply_a_then_b("0123456", rep, ins) == "0R56", "Replace then insert");
  return true;
}

bool test_insert_at_replace_boundaries() {
  auto rep = TextOperation::make_replace(2, 3, "R", "alice", 9, "a");
  auto at_start = TextOperation::make_insert(2, "S", "bob", 1, "b");
  auto at_end = TextOperation::make_insert(5, "E", "carol", 1, "c");

  TEST_ASSERT(apply_b_then_a("0123456", rep, at_start) == "01SR56", "Insert at the start goes before the text");
  TEST_ASSERT(apply_a_then_b("0123456", rep, at_start) == "01SR56", "In both orders");
  TEST_ASSERT(apply_b_then_a("0123456", rep, at_end) == "01RE56", "Insert at the end goes after the text");
  TEST_ASSERT(apply_a_then_b("0123456", rep, at_end) == "01RE56", "In both orders");
  return true;
}

bool test_replace_inside_delete_is_absorbed() {
  auto rep = TextOperation::make_replace(3, 2, "R", "alice", 1, "a");
  auto del = TextOperation::make_delete(1, 6, "bob", 1, "b");

  TEST_ASSERT(transform(rep, del).kind() == OperationKind::Retain, "Strictly covered Replace is a Retain");
  TEST_ASSERT(apply_b_then_a("0123456789", rep, del) == "0789", "Delete then replace");
  TEST_ASSERT(apply_a_then_b("0123456789", rep, del) == "0789", "Replace then delete");
  return true;
}

bool test_replace_covered_at_edge_keeps_text() {
  auto rep = TextOperation::make_replace(1, 2, "R", "alice", 1, "a");
  auto del = TextOperation::make_delete(1, 4, "bob", 1, "b");

  auto rep2 = transform(rep, del);
  TEST_ASSERT(rep2.kind() == OperationKind::Insert && rep2.position() == 1, "Replace keeps its text as an Insert");
  TEST_ASSERT(apply_b_then_a("0123456", rep, del) == "0R56", "Delete then replace");
  TEST_ASSERT(apply_a_then_b("0123456", rep, del) == "0R56", "Replace then delete");
  return true;
}

bool test_identical_replaces_use_tie_break() {
  auto a = TextOperation::make_replace(1, 2, "A", "alice", 2, "a");
  auto b = TextOperation::make_replace(1, 2, "B", "bob", 1, "b");
  TEST_ASSERT(apply_b_then_a("0123", a, b) == "0BA3", "Lower logical time's text first");
  TEST_ASSERT(apply_a_then_b("0123", a, b) == "0BA3", "In both orders");
  return true;
}

bool test_overlapping_replaces() {
  auto a = TextOperation::make_replace(2, 4, "AA", "alice", 1, "a");
  auto b = TextOperation::make_replace(4, 4, "BB", "bob", 1, "b");
  TEST_ASSERT(apply_b_then_a("0123456789", a, b) == "01AABB89", "B then A");
  TEST_ASSERT(apply_a_then_b("0123456789", a, b) == "01AABB89", "A then B");
  return true;
}

// Fold

bool test_rebase_folds_in_order() {
  // Base "abcdef". History: insert "XY" at 0, then delete [4,6) of "XYabcdef" ("cd").
  std::vector<TextOperation> applied = {
      TextOperation::make_insert(0, "XY", "bob", 1, "h1"),
      TextOperation::make_delete(4, 2, "bob", 2, "h2"),
  };
  // Client deletes "e" (position 4 in "abcdef")
  auto op = TextOperation::make_delete(4, 1, "alice", 1, "c1");
  auto rebased = rebase(op, applied);
  TEST_ASSERT(rebased.position() == 4 && rebased.length() == 1, "Shifted right by 2, then left by 2");

  std::u32string content = U"abcdef";
  for (const auto &h : applied) {
    h.apply_to(content);
  }
  rebased.apply_to(content);
  TEST_ASSERT(utf8::encode(content) == "XYabf", "Client's intended character is removed");
  return true;
}

// Properties

static TextOperation random_operation(std::mt19937 &rng, uint64_t length, const std::string &author, int serial) {
  static const char *texts[] = {"x", "yz", "\xC3\xA9", "uvw"};
  std::uniform_int_distribution<int> kind_dist(0, 9);
  std::uniform_int_distribution<uint64_t> time_dist(1, 3);
  std::uniform_int_distribution<int> text_dist(0, 3);
  std::string id = author + "-" + std::to_string(serial);
  uint64_t time = time_dist(rng);

  int k = kind_dist(rng);
  if (length == 0 || k < 4) {
    std::uniform_int_distribution<uint64_t> pos(0, length);
    return TextOperation::make_insert(pos(rng), texts[text_dist(rng)], author, time, id);
  }
  std::uniform_int_distribution<uint64_t> start_dist(0, length - 1);
  uint64_t start = start_dist(rng);
  std::uniform_int_distribution<uint64_t> len_dist(1, length - start);
  uint64_t span = len_dist(rng);
  if (k < 8) {
    return TextOperation::make_delete(start, span, author, time, id);
  }
  if (k < 9) {
    return TextOperation::make_replace(start, span, texts[text_dist(rng)], author, time, id);
  }
  std::uniform_int_distribution<uint64_t> pos(0, length);
  return TextOperation::make_retain(pos(rng), author, time, id);
}

static std::string random_text(std::mt19937 &rng) {
  std::uniform_int_distribution<int> len_dist(0, 12);
  std::uniform_int_distribution<int> ch_dist(0, 25);
  std::string text;
  int n = len_dist(rng);
  for (int i = 0; i < n; ++i) {
    text.push_back(static_cast<char>('a' + ch_dist(rng)));
  }
  return text;
}

bool test_convergence_property() {
  std::mt19937 rng(42);
  for (int i = 0; i < 20000; ++i) {
    std::string text = random_text(rng);
    uint64_t length = text.size();
    auto a = random_operation(rng, length, "alice", i);
    auto b = random_operation(rng, length, "bob", i);

    std::string left = apply_b_then_a(text, a, b);
    std::string right = apply_a_then_b(text, a, b);
    if (left != right) {
      std::cerr << "Divergence on \"" << text << "\": a=" << a.to_string() << " b=" << b.to_string() << " -> \""
                << left << "\" vs \"" << right << "\"\n";
    }
    TEST_ASSERT(left == right, "Both application orders must converge");
  }
  return true;
}

bool test_bounds_preserved_property() {
  std::mt19937 rng(7);
  for (int i = 0; i < 20000; ++i) {
    std::string text = random_text(rng);
    uint64_t length = text.size();
    auto a = random_operation(rng, length, "alice", i);
    auto b = random_operation(rng, length, "bob", i);

    uint64_t after_b = length - b.removed_length() + b.inserted_length();
    auto a2 = transform(a, b);
    TEST_ASSERT(a2.position() <= after_b, "Rebased position within the document");
    TEST_ASSERT(a2.end() <= after_b, "Rebased range within the document");
  }
  return true;
}

bool test_transform_is_pure() {
  auto a = TextOperation::make_delete(2, 3, "alice", 1, "a");
  auto b = TextOperation::make_insert(3, "XY", "bob", 1, "b");
  auto a_copy = a;
  auto b_copy = b;
  auto first = transform(a, b);
  auto second = transform(a, b);
  TEST_ASSERT(first == second, "Same inputs give the same output");
  TEST_ASSERT(a == a_copy && b == b_copy, "Inputs are not modified");
  return true;
}

int main() {
  int total = 0, passed = 0, failed = 0;

  std::cout << "=== Transform Tests ===\n";

  std::cout << "\n--- Insert vs Insert ---\n";
  RUN_TEST(test_insert_after_earlier_insert_shifts);
  RUN_TEST(test_insert_tie_lower_logical_time_first);
  RUN_TEST(test_insert_tie_same_time_uses_author);

  std::cout << "\n--- Insert vs Delete ---\n";
  RUN_TEST(test_insert_after_delete_moves_back);
  RUN_TEST(test_insert_at_delete_start_is_kept);
  RUN_TEST(test_insert_at_delete_end_is_kept);
  RUN_TEST(test_delete_absorbs_insert_inside_range);

  std::cout << "\n--- Delete vs Insert ---\n";
  RUN_TEST(test_delete_after_insert_shifts);
  RUN_TEST(test_delete_before_insert_unchanged);

  std::cout << "\n--- Delete vs Delete ---\n";
  RUN_TEST(test_overlapping_deletes);
  RUN_TEST(test_contained_delete_becomes_retain);
  RUN_TEST(test_identical_deletes);
  RUN_TEST(test_disjoint_deletes_shift);

  std::cout << "\n--- Retain and Replace ---\n";
  RUN_TEST(test_retain_is_neutral);
  RUN_TEST(test_replace_against_insert_inside);
  RUN_TEST(test_insert_at_replace_boundaries);
  RUN_TEST(test_replace_inside_delete_is_absorbed);
  RUN_TEST(test_replace_covered_at_edge_keeps_text);
  RUN_TEST(test_identical_replaces_use_tie_break);
  RUN_TEST(test_overlapping_replaces);

  std::cout << "\n--- Rebase and Properties ---\n";
  RUN_TEST(test_rebase_folds_in_order);
  RUN_TEST(test_convergence_property);
  RUN_TEST(test_bounds_preserved_property);
  RUN_TEST(test_transform_is_pure);

  std::cout << "\n=== Summary ===\n";
  std::cout << "Total:  " << total << "\n";
  std::cout << "Passed: " << passed << "\n";
  std::cout << "Failed: " << failed << "\n";

  return failed == 0 ? 0 : 1;
}
