/*
 * server.hh -- dispatch of protocol requests to the backend
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#ifndef _IDM_SERVER_HH
#define _IDM_SERVER_HH 1

#include <chrono>
#include <optional>
#include <string>

#include "idm/auth.hh"
#include "idm/auth_session.hh"
#include "idm/backend.hh"
#include "idm/error.hh"
#include "idm/filter.hh"
#include "idm/proto.hh"

namespace idm {

/**
 * Executes the requests of the protocol against a backend. Each
 * handler takes the token of the authenticated caller, if any.
 * Search and SearchRecycled are open to everyone; all changes and
 * Whoami fail with OperationError::NotAuthenticated without a token.
 *
 * The server issues tokens for the authentication sessions it
 * keeps: the principal is the entry whose "name" equals the
 * principal name given in Init.
 */
class QueryServer {
public:
  /** @p max_filter_depth is kept within 1 and IDM_FILTER_DEPTH_LIMIT. */
  QueryServer(Backend &backend, const SchemaValidator &schema,
              const CredentialVerifier &verifier,
              std::chrono::seconds session_timeout =
                std::chrono::seconds(IDM_AUTH_SESSION_TIMEOUT),
              size_t max_filter_depth = IDM_FILTER_MAX_DEPTH);
  QueryServer(const QueryServer &) = delete;
  QueryServer &operator=(const QueryServer &) = delete;

  Result<SearchResponse> handle_search(const SearchRequest &request,
                                       const std::optional<UserAuthToken> &uat);
  Result<OperationResponse> handle_create(const CreateRequest &request,
                                          const std::optional<UserAuthToken> &uat);
  Result<OperationResponse> handle_delete(const DeleteRequest &request,
                                          const std::optional<UserAuthToken> &uat);
  Result<OperationResponse> handle_modify(const ModifyRequest &request,
                                          const std::optional<UserAuthToken> &uat);
  Result<AuthResponse> handle_auth(const AuthRequest &request);
  Result<WhoamiResponse> handle_whoami(const WhoamiRequest &request,
                                       const std::optional<UserAuthToken> &uat);
  Result<SearchResponse> handle_search_recycled(const SearchRecycledRequest &request,
                                                const std::optional<UserAuthToken> &uat);
  Result<OperationResponse> handle_revive_recycled(const ReviveRecycledRequest &request,
                                                   const std::optional<UserAuthToken> &uat);

  /** Returns the token of the successful session @p sessionid. */
  std::optional<UserAuthToken> session_token(const Uuid &sessionid) const;

  /** Runs the consistency checks of the backend. */
  Result<void> verify(void) const;

  AuthSessionStore &sessions(void) { return auth; }
  size_t max_filter_depth(void) const { return max_depth; }

private:
  Backend &backend;
  const SchemaValidator &schema;
  AuthSessionStore auth;
  const size_t max_depth;

  /* Canonicalizes @p filter and replaces SelfUUID by the caller. */
  Result<Filter> prepare(const Filter &filter,
                         const std::optional<UserAuthToken> &uat) const;

  /* Like prepare() but rejects the always false filter. */
  Result<Filter> prepare_change(const Filter &filter,
                                const std::optional<UserAuthToken> &uat) const;

  std::optional<UserAuthToken> issue_token(const std::string &principal,
                                           const std::optional<std::string> &application) const;
};

} /* namespace idm */

#endif /* _IDM_SERVER_HH */
