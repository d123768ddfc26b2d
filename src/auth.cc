/*
 * auth.cc -- authentication steps, states and the user token
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#include <iomanip>
#include <ostream>

#include "idm/auth.hh"

namespace idm {

static const char *mechanismNames[] = { "Anonymous", "Password" };

const char *
auth_allowed_name(AuthAllowed mech) {
  return mechanismNames[static_cast<size_t>(mech)];
}

std::optional<AuthAllowed>
auth_allowed_from_name(const std::string &name) {
  for (size_t idx = 0; idx < sizeof(mechanismNames)/sizeof(mechanismNames[0]); idx++) {
    if (name == mechanismNames[idx]) {
      return static_cast<AuthAllowed>(idx);
    }
  }
  return std::nullopt;
}

AuthAllowed
AuthCredential::mechanism(void) const {
  return kind == Kind::Password ? AuthAllowed::Password : AuthAllowed::Anonymous;
}

template <typename T>
static void
show_list(std::ostream &os, const char *type, const std::vector<T> &items) {
  const char *sep = "";
  os << '[';
  for (const auto &item : items) {
    os << sep << type << " { name: " << std::quoted(item.name)
       << ", uuid: " << std::quoted(item.uuid) << " }";
    sep = ", ";
  }
  os << ']';
}

std::ostream &
operator<<(std::ostream &os, const UserAuthToken &uat) {
  os << "name: " << uat.name << '\n'
     << "display: " << uat.displayname << '\n'
     << "uuid: " << uat.uuid << '\n';
  if (uat.application) {
    os << "application: " << uat.application->name << '\n';
  }
  os << "groups: ";
  show_list(os, "Group", uat.groups);
  os << '\n' << "claims: ";
  show_list(os, "Claim", uat.claims);
  return os << '\n';
}

std::ostream &
operator<<(std::ostream &os, const AuthState &state) {
  switch (state.kind) {
  case AuthState::Kind::Success:
    os << "Success(" << (state.token ? state.token->name : std::string()) << ')';
    break;
  case AuthState::Kind::Denied:
    os << "Denied(" << std::quoted(state.reason) << ')';
    break;
  case AuthState::Kind::Continue: {
    const char *sep = "";
    os << "Continue([";
    for (auto mech : state.allowed) {
      os << sep << auth_allowed_name(mech);
      sep = ", ";
    }
    os << "])";
    break;
  }
  }
  return os;
}

} /* namespace idm */
