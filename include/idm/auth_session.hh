/*
 * auth_session.hh -- the authentication negotiation state machine
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#ifndef _IDM_AUTH_SESSION_HH
#define _IDM_AUTH_SESSION_HH 1

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "idm/auth.hh"
#include "idm/backend.hh"
#include "idm/error.hh"
#include "idm/uuid.hh"

/** Default inactivity window of an authentication session in seconds. */
#ifndef IDM_AUTH_SESSION_TIMEOUT
#define IDM_AUTH_SESSION_TIMEOUT 300
#endif /* IDM_AUTH_SESSION_TIMEOUT */

/** The only reason ever given for a denial. */
#define IDM_AUTH_DENIED_REASON "authentication denied"

namespace idm {

/**
 * Creates the token for a principal that has satisfied all required
 * mechanisms. Returns std::nullopt if no token can be issued, which
 * denies the session.
 */
using TokenIssuer =
  std::function<std::optional<UserAuthToken>(const std::string &principal,
                                              const std::optional<std::string> &application)>;

/**
 * Stores the state of all running negotiations, keyed by session id.
 *
 * A session starts with Init in state Continue, or Denied if the
 * principal is unknown. Each Creds step moves it to Continue, Success
 * or Denied. Success and Denied are final: every further step on
 * the session fails with OperationError::InvalidSessionState. Only
 * one step per session is processed at a time; a step arriving while
 * another one is being verified fails the same way.
 *
 * Sessions that are idle for longer than the timeout are denied
 * (Continue) or dropped (Success, Denied) by expire().
 */
class AuthSessionStore {
public:
  using Clock = std::chrono::steady_clock;
  using ClockFunc = std::function<Clock::time_point(void)>;

  AuthSessionStore(const CredentialVerifier &verifier, TokenIssuer issuer,
                   std::chrono::seconds timeout =
                     std::chrono::seconds(IDM_AUTH_SESSION_TIMEOUT));
  AuthSessionStore(const AuthSessionStore &) = delete;
  AuthSessionStore &operator=(const AuthSessionStore &) = delete;

  /** Replaces the time source. Used to test expiry. */
  void set_clock(ClockFunc func);

  /** Dispatches @p request to init() or creds(). */
  Result<AuthResponse> step(const AuthRequest &request);

  /** Starts a new negotiation for @p principal. */
  Result<AuthResponse> init(const std::string &principal,
                            const std::optional<std::string> &application);

  /** Advances the negotiation @p sessionid with @p creds. */
  Result<AuthResponse> creds(const Uuid &sessionid,
                             const std::vector<AuthCredential> &creds);

  /** Returns the token bound to a successful, unexpired session. */
  std::optional<UserAuthToken> token(const Uuid &sessionid) const;

  /** Returns the current state of @p sessionid, if known. */
  std::optional<AuthState> state(const Uuid &sessionid) const;

  /**
   * Denies idle Continue sessions and drops idle final ones.
   * @return The number of sessions that were denied or dropped.
   */
  size_t expire(void);

  size_t size(void) const;

private:
  struct Session {
    std::string principal;
    std::optional<std::string> application;
    AuthState state;
    std::set<AuthAllowed> required;
    std::set<AuthAllowed> satisfied;
    Clock::time_point last_activity;
    bool busy;
  };

  const CredentialVerifier &verifier;
  TokenIssuer issuer;
  const std::chrono::seconds timeout;
  ClockFunc now;

  mutable std::mutex mutex;
  std::map<Uuid, Session> sessions;

  /* must be called with mutex held */
  Uuid new_sessionid(void) const;
  bool idle(const Session &session, Clock::time_point t) const {
    return t - session.last_activity > timeout;
  }
};

} /* namespace idm */

#endif /* _IDM_AUTH_SESSION_HH */
