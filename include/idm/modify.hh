/*
 * modify.hh -- attribute mutations
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#ifndef _IDM_MODIFY_HH
#define _IDM_MODIFY_HH 1

#include <iosfwd>
#include <string>
#include <vector>

#include <stdint.h>

#include "idm/entry.hh"

namespace idm {

/** A single attribute mutation. */
struct Modify {
  enum class Kind : uint8_t { Present, Removed, Purged };

  Kind kind;
  std::string attr;
  std::string value;          /* unused for Purged */

  static Modify present(const std::string &a, const std::string &v) {
    return Modify{ Kind::Present, a, v };
  }
  static Modify removed(const std::string &a, const std::string &v) {
    return Modify{ Kind::Removed, a, v };
  }
  static Modify purged(const std::string &a) {
    return Modify{ Kind::Purged, a, std::string() };
  }

  const char *name(void) const;

  bool operator==(const Modify &other) const {
    return kind == other.kind && attr == other.attr && value == other.value;
  }
  bool operator!=(const Modify &other) const { return !(*this == other); }
};

/**
 * An ordered list of mutations. The order is significant: the
 * modifications are applied from first to last, so a later Purged
 * cancels an earlier Present on the same attribute.
 */
struct ModifyList {
  std::vector<Modify> mods;

  ModifyList(void) = default;
  explicit ModifyList(const std::vector<Modify> &m) : mods(m) {}

  bool empty(void) const { return mods.empty(); }

  /** Checks whether any modification touches @p attr. */
  bool touches(const std::string &attr) const;

  /**
   * Applies all modifications to a copy of @p entry and returns the
   * result. Present appends the value, Removed drops every
   * occurrence of the value, Purged drops the attribute. An attribute
   * left without values is removed.
   */
  Entry apply(const Entry &entry) const;

  bool operator==(const ModifyList &other) const { return mods == other.mods; }
  bool operator!=(const ModifyList &other) const { return mods != other.mods; }
};

std::ostream &operator<<(std::ostream &os, const Modify &mod);
std::ostream &operator<<(std::ostream &os, const ModifyList &modlist);

} /* namespace idm */

#endif /* _IDM_MODIFY_HH */
