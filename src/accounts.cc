/*
 * accounts.cc -- credential verification against configured accounts
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#include "idm/idm_debug.hh"
#include "idm/accounts.hh"

namespace idm {

/* Compares the secrets in time independent of the first mismatch. */
static bool
secret_equal(const std::string &a, const std::string &b) {
  unsigned char diff = a.size() != b.size();
  for (size_t idx = 0; idx < a.size(); idx++) {
    diff |= static_cast<unsigned char>(a[idx]) ^
      static_cast<unsigned char>(idx < b.size() ? b[idx] : 0);
  }
  return diff == 0;
}

void
AccountStore::add(const Account &account) {
  std::lock_guard<std::mutex> lock(mutex);
  accounts[account.name] = account;
}

bool
AccountStore::lock(const std::string &name, bool locked) {
  std::lock_guard<std::mutex> guard(mutex);
  auto it = accounts.find(name);
  if (it == accounts.end()) {
    return false;
  }
  it->second.locked = locked;
  return true;
}

std::set<AuthAllowed>
AccountStore::required_mechanisms(const std::string &principal) const {
  std::lock_guard<std::mutex> lock(mutex);
  auto it = accounts.find(principal);
  if ((it == accounts.end()) || it->second.locked) {
    return {};
  }
  return it->second.mechanisms;
}

bool
AccountStore::verify(const std::string &principal,
                     const std::vector<AuthCredential> &creds) const {
  std::lock_guard<std::mutex> lock(mutex);
  auto it = accounts.find(principal);
  if ((it == accounts.end()) || it->second.locked || creds.empty()) {
    return false;
  }

  const Account &account = it->second;
  for (const auto &c : creds) {
    if (!account.mechanisms.count(c.mechanism())) {
      return false;
    }
    if ((c.kind == AuthCredential::Kind::Password)
        && !secret_equal(c.secret, account.password)) {
      idm_log(IDM_LOG_DEBUG, "password mismatch for %s\n", principal.c_str());
      return false;
    }
  }
  return true;
}

} /* namespace idm */
