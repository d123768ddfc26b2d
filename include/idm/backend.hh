/*
 * backend.hh -- interfaces of the collaborators consumed by the
 *               query server
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#ifndef _IDM_BACKEND_HH
#define _IDM_BACKEND_HH 1

#include <set>
#include <functional>
#include <string>
#include <vector>

#include "idm/auth.hh"
#include "idm/entry.hh"
#include "idm/error.hh"
#include "idm/filter.hh"

namespace idm {

using Entries = std::vector<Entry>;

/**
 * Storage and query engine. All filters passed in are canonical and
 * free of SelfUUID. Entries are identified by their "uuid" attribute.
 */
class Backend {
public:
  virtual ~Backend(void) = default;

  /** Returns all live entries matching @p filter. */
  virtual Result<Entries> evaluate(const Filter &filter) const = 0;

  /** Returns all recycled (soft-deleted) entries matching @p filter. */
  virtual Result<Entries> evaluate_recycled(const Filter &filter) const = 0;

  /** Stores new @p entries. Fails without change if any uuid is taken. */
  virtual Result<void> create(const Entries &entries) = 0;

  /** Replaces the live entries with the same uuids by @p entries. */
  virtual Result<void> replace(const Entries &entries) = 0;

  /** Computes the new version of an entry for modify(). */
  using Modifier = std::function<Result<Entry>(const Entry &)>;

  /**
   * Applies @p modifier to every live entry matching @p filter as one
   * step: no other change to the live set is seen in between. If the
   * modifier fails or changes the uuid of any entry, nothing is
   * stored and the error is returned.
   *
   * @return The number of entries changed.
   */
  virtual Result<size_t> modify(const Filter &filter, const Modifier &modifier) = 0;

  /** Moves the given live entries to the recycle bin. */
  virtual Result<void> recycle(const Entries &entries) = 0;

  /** Moves the given recycled entries back to the live set. */
  virtual Result<void> revive(const Entries &entries) = 0;

  /**
   * Runs the structural integrity checks. Each check contributes one
   * result per fault found, or a single Ok result if it passed.
   */
  virtual std::vector<ConsistencyResult> verify(void) const = 0;
};

/** Checks entries against the schema before they are stored. */
class SchemaValidator {
public:
  virtual ~SchemaValidator(void) = default;
  virtual Result<void, SchemaError> validate(const Entry &entry) const = 0;
};

/** Verifies secrets. The auth state machine never sees them otherwise. */
class CredentialVerifier {
public:
  virtual ~CredentialVerifier(void) = default;

  /** Checks all @p creds against the secrets of @p principal. */
  virtual bool verify(const std::string &principal,
                      const std::vector<AuthCredential> &creds) const = 0;

  /**
   * Returns the mechanisms that must all be satisfied before
   * @p principal is authenticated. An empty set denotes an unknown or
   * locked principal.
   */
  virtual std::set<AuthAllowed> required_mechanisms(const std::string &principal) const = 0;
};

} /* namespace idm */

#endif /* _IDM_BACKEND_HH */
