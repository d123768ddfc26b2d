/*
 * entry.hh -- directory objects as attribute/multi-value maps
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#ifndef _IDM_ENTRY_HH
#define _IDM_ENTRY_HH 1

#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace idm {

/** The values of one attribute in insertion order. */
using Values = std::vector<std::string>;
using Attrs = std::map<std::string, Values>;

/**
 * A directory object. Entries are not changed in place: a Modify
 * applied by the backend yields a new Entry.
 */
class Entry {
public:
  Entry(void) = default;
  explicit Entry(const Attrs &a) : attrs(a) {}
  explicit Entry(Attrs &&a) : attrs(std::move(a)) {}

  const Attrs &attributes(void) const { return attrs; }

  /** Returns the values of @p attr or nullptr if @p attr is absent. */
  const Values *get(const std::string &attr) const;

  /** Returns the first value of @p attr if present. */
  std::optional<std::string> first(const std::string &attr) const;

  /** Checks whether @p attr is present with at least one value. */
  bool present(const std::string &attr) const;

  /** Checks whether @p attr contains exactly @p value. */
  bool equals(const std::string &attr, const std::string &value) const;

  /** Checks whether a value of @p attr contains @p value. */
  bool contains(const std::string &attr, const std::string &value) const;

  /** The value of the "uuid" attribute, if any. */
  std::optional<std::string> uuid(void) const { return first("uuid"); }

  /** Returns a copy where @p attr holds @p values. */
  Entry with(const std::string &attr, const Values &values) const;

  bool operator==(const Entry &other) const { return attrs == other.attrs; }
  bool operator!=(const Entry &other) const { return attrs != other.attrs; }

private:
  Attrs attrs;
};

std::ostream &operator<<(std::ostream &os, const Entry &entry);

} /* namespace idm */

#endif /* _IDM_ENTRY_HH */
