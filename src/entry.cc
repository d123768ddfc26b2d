/*
 * entry.cc -- directory objects as attribute/multi-value maps
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#include <algorithm>
#include <iomanip>
#include <ostream>

#include "idm/entry.hh"

namespace idm {

const Values *
Entry::get(const std::string &attr) const {
  auto it = attrs.find(attr);
  return it != attrs.end() ? &it->second : nullptr;
}

std::optional<std::string>
Entry::first(const std::string &attr) const {
  const Values *values = get(attr);
  if (values && !values->empty()) {
    return values->front();
  }
  return std::nullopt;
}

bool
Entry::present(const std::string &attr) const {
  const Values *values = get(attr);
  return values && !values->empty();
}

bool
Entry::equals(const std::string &attr, const std::string &value) const {
  const Values *values = get(attr);
  return values
    && std::find(values->begin(), values->end(), value) != values->end();
}

bool
Entry::contains(const std::string &attr, const std::string &value) const {
  const Values *values = get(attr);
  return values
    && std::any_of(values->begin(), values->end(),
                   [&value](const auto &v) {
                     return v.find(value) != std::string::npos;
                   });
}

Entry
Entry::with(const std::string &attr, const Values &values) const {
  Attrs copy{attrs};
  copy[attr] = values;
  return Entry{std::move(copy)};
}

std::ostream &
operator<<(std::ostream &os, const Entry &entry) {
  os << '{';
  const char *sep = "";
  for (const auto &a : entry.attributes()) {
    os << sep << std::quoted(a.first) << ": [";
    const char *vsep = "";
    for (const auto &v : a.second) {
      os << vsep << std::quoted(v);
      vsep = ", ";
    }
    os << ']';
    sep = ", ";
  }
  return os << '}';
}

} /* namespace idm */
