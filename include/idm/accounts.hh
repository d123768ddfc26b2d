/*
 * accounts.hh -- credential verification against configured accounts
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#ifndef _IDM_ACCOUNTS_HH
#define _IDM_ACCOUNTS_HH 1

#include <map>
#include <mutex>
#include <set>
#include <string>

#include "idm/backend.hh"

namespace idm {

struct Account {
  std::string name;
  std::set<AuthAllowed> mechanisms;
  std::string password;
  bool locked = false;
};

class AccountStore : public CredentialVerifier {
public:
  /** Adds or replaces @p account. */
  void add(const Account &account);

  /** Sets the locked flag of @p name. Returns false if unknown. */
  bool lock(const std::string &name, bool locked = true);

  bool verify(const std::string &principal,
              const std::vector<AuthCredential> &creds) const override;
  std::set<AuthAllowed> required_mechanisms(const std::string &principal) const override;

private:
  mutable std::mutex mutex;
  std::map<std::string, Account> accounts;
};

} /* namespace idm */

#endif /* _IDM_ACCOUNTS_HH */
