/*
 * filter.cc -- recursive query filters and their canonical form
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <utility>

#include "idm/idm_debug.hh"
#include "idm/filter.hh"

namespace idm {

static const char *filterNames[] = {
  "Eq", "Sub", "Pres", "Or", "And", "AndNot", "SelfUUID"
};

Filter
Filter::make_eq(const std::string &a, const std::string &v) {
  Filter f{Kind::Eq};
  f.attr = a;
  f.val = v;
  return f;
}

Filter
Filter::make_sub(const std::string &a, const std::string &v) {
  Filter f{Kind::Sub};
  f.attr = a;
  f.val = v;
  return f;
}

Filter
Filter::make_pres(const std::string &a) {
  Filter f{Kind::Pres};
  f.attr = a;
  return f;
}

Filter
Filter::make_or(const Children &children) {
  Filter f{Kind::Or};
  f.subs = children;
  return f;
}

Filter
Filter::make_and(const Children &children) {
  Filter f{Kind::And};
  f.subs = children;
  return f;
}

Filter
Filter::make_andnot(const Filter &child) {
  Filter f{Kind::AndNot};
  f.subs.push_back(child);
  return f;
}

Filter
Filter::make_self(void) {
  return Filter{Kind::Self};
}

const char *
Filter::name(void) const {
  return filterNames[static_cast<size_t>(kind_)];
}

/* Compares the node data of a and b, ignoring their children. */
static int
compare_node(const Filter &a, const Filter &b) {
  if (a.kind() != b.kind()) {
    return a.kind() < b.kind() ? -1 : 1;
  }
  int res = a.attribute().compare(b.attribute());
  if (res == 0) {
    res = a.value().compare(b.value());
  }
  return (res > 0) - (res < 0);
}

int
Filter::compare_sorted(const Filter &other) const {
  struct Frame {
    const Children *lhs;
    const Children *rhs;
    size_t idx;
  };

  int res = compare_node(*this, other);
  if (res != 0) {
    return res;
  }

  std::vector<Frame> stack{ Frame{ &subs, &other.subs, 0 } };
  while (!stack.empty()) {
    Frame &top = stack.back();
    const size_t common = std::min(top.lhs->size(), top.rhs->size());

    if (top.idx == common) {
      if (top.lhs->size() != top.rhs->size()) {
        return top.lhs->size() < top.rhs->size() ? -1 : 1;
      }
      stack.pop_back();
      continue;
    }

    const Filter &a = (*top.lhs)[top.idx];
    const Filter &b = (*top.rhs)[top.idx];
    top.idx++;

    if ((res = compare_node(a, b)) != 0) {
      return res;
    }
    /* top is invalidated here */
    stack.push_back(Frame{ &a.subs, &b.subs, 0 });
  }
  return 0;
}

bool
Filter::is_sorted(void) const {
  std::vector<const Filter *> todo{ this };

  while (!todo.empty()) {
    const Filter *node = todo.back();
    todo.pop_back();

    for (size_t idx = 0; idx < node->subs.size(); idx++) {
      if (node->is_combinator() && idx > 0
          && node->subs[idx - 1].compare_sorted(node->subs[idx]) > 0) {
        return false;
      }
      todo.push_back(&node->subs[idx]);
    }
  }
  return true;
}

Filter
Filter::sorted(void) const {
  if (subs.empty()) {
    return *this;
  }

  Filter result{kind_};
  result.subs.reserve(subs.size());
  for (const auto &child : subs) {
    result.subs.push_back(child.sorted());
  }
  if (is_combinator()) {
    std::sort(result.subs.begin(), result.subs.end(),
              [](const Filter &a, const Filter &b) {
                return a.compare_sorted(b) < 0;
              });
  }
  return result;
}

int
Filter::compare(const Filter &other) const {
  /* canonical trees are sorted already and need no copy */
  if (is_sorted() && other.is_sorted()) {
    return compare_sorted(other);
  }
  return sorted().compare_sorted(other.sorted());
}

size_t
Filter::depth(void) const {
  std::vector<std::pair<const Filter *, size_t> > todo{ { this, 1 } };
  size_t max_depth = 0;

  while (!todo.empty()) {
    auto [node, level] = todo.back();
    todo.pop_back();

    max_depth = std::max(max_depth, level);
    for (const auto &child : node->subs) {
      todo.emplace_back(&child, level + 1);
    }
  }
  return max_depth;
}

bool
Filter::contains_self(void) const {
  std::vector<const Filter *> todo{ this };

  while (!todo.empty()) {
    const Filter *node = todo.back();
    todo.pop_back();

    if (node->kind_ == Kind::Self) {
      return true;
    }
    for (const auto &child : node->subs) {
      todo.push_back(&child);
    }
  }
  return false;
}

Filter
Filter::resolve_self(const std::string &uuid) const {
  if (kind_ == Kind::Self) {
    return make_eq("uuid", uuid);
  }

  Filter result{*this};
  for (auto &child : result.subs) {
    child = child.resolve_self(uuid);
  }
  return result;
}

/* Computes the canonical form of a tree that passed the depth check. */
static Filter
canonical(const Filter &filter) {
  switch (filter.kind()) {
  case Filter::Kind::Or:
  case Filter::Kind::And: {
    Filter::Children operands;

    for (const auto &child : filter.children()) {
      Filter c = canonical(child);
      if (c.kind() == filter.kind()) {
        /* c is canonical, so its operands are already flat */
        operands.insert(operands.end(),
                        c.children().begin(), c.children().end());
      } else {
        operands.push_back(std::move(c));
      }
    }

    std::sort(operands.begin(), operands.end());
    operands.erase(std::unique(operands.begin(), operands.end()),
                   operands.end());

    if (operands.size() == 1) {
      return operands.front();
    }
    return filter.kind() == Filter::Kind::And
      ? Filter::make_and(operands) : Filter::make_or(operands);
  }
  case Filter::Kind::AndNot:
    return Filter::make_andnot(canonical(filter.children().front()));
  default:
    return filter;
  }
}

Result<Filter>
canonicalize(const Filter &filter, size_t max_depth) {
  const size_t depth = filter.depth();

  if (depth > max_depth) {
    idm_log(IDM_LOG_WARNING, "filter nesting depth %zu exceeds limit %zu\n",
            depth, max_depth);
    return OperationError{OperationError::Kind::FilterGeneration};
  }
  return canonical(filter);
}

std::ostream &
operator<<(std::ostream &os, const Filter &filter) {
  switch (filter.kind()) {
  case Filter::Kind::Eq:
  case Filter::Kind::Sub:
    return os << filter.name() << '(' << std::quoted(filter.attribute())
              << ", " << std::quoted(filter.value()) << ')';
  case Filter::Kind::Pres:
    return os << filter.name() << '(' << std::quoted(filter.attribute()) << ')';
  case Filter::Kind::Or:
  case Filter::Kind::And: {
    const char *sep = "";
    os << filter.name() << "([";
    for (const auto &child : filter.children()) {
      os << sep << child;
      sep = ", ";
    }
    return os << "])";
  }
  case Filter::Kind::AndNot:
    return os << filter.name() << '(' << filter.children().front() << ')';
  case Filter::Kind::Self:
  default:
    return os << filter.name();
  }
}

} /* namespace idm */
