/*
 * filter.hh -- recursive query filters and their canonical form
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#ifndef _IDM_FILTER_HH
#define _IDM_FILTER_HH 1

#include <iosfwd>
#include <string>
#include <vector>

#include <stdint.h>

#include "idm/error.hh"

/**
 * Maximum nesting depth of a filter that is accepted by
 * canonicalize() and by the wire decoder. A leaf has depth 1.
 */
#ifndef IDM_FILTER_MAX_DEPTH
#define IDM_FILTER_MAX_DEPTH 64
#endif /* IDM_FILTER_MAX_DEPTH */

/**
 * Upper bound for a configured filter depth. Evaluation and decoding
 * recurse once per level.
 */
#ifndef IDM_FILTER_DEPTH_LIMIT
#define IDM_FILTER_DEPTH_LIMIT 256
#endif /* IDM_FILTER_DEPTH_LIMIT */

namespace idm {

/**
 * A boolean query over entry attributes.
 *
 * The empty conjunction And([]) matches every entry, the empty
 * disjunction Or([]) matches none. Both are kept as they are by
 * canonicalize() and serve as the canonical "always true" and "always
 * false" filters.
 */
class Filter {
public:
  /* The order of the variants defines the rank used by compare(). */
  enum class Kind : uint8_t { Eq, Sub, Pres, Or, And, AndNot, Self };
  using Children = std::vector<Filter>;

  static Filter make_eq(const std::string &attr, const std::string &value);
  static Filter make_sub(const std::string &attr, const std::string &value);
  static Filter make_pres(const std::string &attr);
  static Filter make_or(const Children &children);
  static Filter make_and(const Children &children);
  static Filter make_andnot(const Filter &child);
  static Filter make_self(void);

  Kind kind(void) const { return kind_; }
  const char *name(void) const;

  /** The attribute of Eq, Sub and Pres. Empty otherwise. */
  const std::string &attribute(void) const { return attr; }
  /** The asserted value of Eq and Sub. Empty otherwise. */
  const std::string &value(void) const { return val; }
  /** The operands of Or and And, or the single operand of AndNot. */
  const Children &children(void) const { return subs; }

  bool is_combinator(void) const {
    return kind_ == Kind::Or || kind_ == Kind::And;
  }

  /** Checks for the sentinel And([]). */
  bool is_always_true(void) const { return kind_ == Kind::And && subs.empty(); }
  /** Checks for the sentinel Or([]). */
  bool is_always_false(void) const { return kind_ == Kind::Or && subs.empty(); }

  /**
   * Three-way comparison: variant rank first, then attribute, then
   * value, then the children lexicographically. The operands of Or
   * and And are compared in sorted order, so two combinators that
   * differ only in the order of their operands are equal. Returns a
   * negative value, zero or a positive value.
   */
  int compare(const Filter &other) const;

  bool operator==(const Filter &other) const { return compare(other) == 0; }
  bool operator!=(const Filter &other) const { return compare(other) != 0; }
  bool operator<(const Filter &other) const { return compare(other) < 0; }

  /** The nesting depth of this tree, computed without recursion. */
  size_t depth(void) const;

  /** Checks whether SelfUUID occurs anywhere in this tree. */
  bool contains_self(void) const;

  /**
   * Returns a copy where each SelfUUID is replaced by
   * Eq("uuid", @p uuid). The tree must have passed the depth check of
   * canonicalize().
   */
  Filter resolve_self(const std::string &uuid) const;

private:
  Filter(Kind k) : kind_(k) {}

  /* Positional comparison of the children, without recursion. */
  int compare_sorted(const Filter &other) const;
  /* Checks that the operands of every Or and And are in order. */
  bool is_sorted(void) const;
  /* Returns a copy with the operands of every Or and And in order. */
  Filter sorted(void) const;

  Kind kind_;
  std::string attr;
  std::string val;
  Children subs;
};

/**
 * Computes the canonical form of @p filter. Nested combinators of the
 * same kind are flattened, operands are sorted and duplicates are
 * removed. A combinator with a single remaining operand is replaced
 * by that operand.
 *
 * @return The canonical filter or OperationError::FilterGeneration if
 *         @p filter is nested deeper than @p max_depth.
 */
Result<Filter> canonicalize(const Filter &filter,
                            size_t max_depth = IDM_FILTER_MAX_DEPTH);

std::ostream &operator<<(std::ostream &os, const Filter &filter);

} /* namespace idm */

#endif /* _IDM_FILTER_HH */
