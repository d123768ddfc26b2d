/*
 * modify.cc -- attribute mutations
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#include <algorithm>
#include <iomanip>
#include <ostream>

#include "idm/modify.hh"

namespace idm {

static const char *modifyNames[] = { "Present", "Removed", "Purged" };

const char *
Modify::name(void) const {
  return modifyNames[static_cast<size_t>(kind)];
}

bool
ModifyList::touches(const std::string &attr) const {
  return std::any_of(mods.begin(), mods.end(),
                     [&attr](const Modify &m) { return m.attr == attr; });
}

Entry
ModifyList::apply(const Entry &entry) const {
  Attrs attrs{entry.attributes()};

  for (const auto &m : mods) {
    switch (m.kind) {
    case Modify::Kind::Present:
      attrs[m.attr].push_back(m.value);
      break;
    case Modify::Kind::Removed: {
      auto it = attrs.find(m.attr);
      if (it != attrs.end()) {
        Values &values = it->second;
        values.erase(std::remove(values.begin(), values.end(), m.value),
                     values.end());
        if (values.empty()) {
          attrs.erase(it);
        }
      }
      break;
    }
    case Modify::Kind::Purged:
      attrs.erase(m.attr);
      break;
    }
  }
  return Entry{std::move(attrs)};
}

std::ostream &
operator<<(std::ostream &os, const Modify &mod) {
  os << mod.name() << '(' << std::quoted(mod.attr);
  if (mod.kind != Modify::Kind::Purged) {
    os << ", " << std::quoted(mod.value);
  }
  return os << ')';
}

std::ostream &
operator<<(std::ostream &os, const ModifyList &modlist) {
  const char *sep = "";
  os << '[';
  for (const auto &m : modlist.mods) {
    os << sep << m;
    sep = ", ";
  }
  return os << ']';
}

} /* namespace idm */
