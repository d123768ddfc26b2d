/*
 * auth_session.cc -- the authentication negotiation state machine
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#include <algorithm>
#include <iterator>

#include "idm/idm_debug.hh"
#include "idm/auth_session.hh"

namespace idm {

static std::vector<AuthAllowed>
remaining(const std::set<AuthAllowed> &required,
          const std::set<AuthAllowed> &satisfied) {
  std::vector<AuthAllowed> result;
  std::set_difference(required.begin(), required.end(),
                      satisfied.begin(), satisfied.end(),
                      std::back_inserter(result));
  return result;
}

AuthSessionStore::AuthSessionStore(const CredentialVerifier &v,
                                   TokenIssuer i,
                                   std::chrono::seconds t)
  : verifier(v), issuer(std::move(i)), timeout(t),
    now([]() { return Clock::now(); }) {
}

void
AuthSessionStore::set_clock(ClockFunc func) {
  std::lock_guard<std::mutex> lock(mutex);
  now = std::move(func);
}

Uuid
AuthSessionStore::new_sessionid(void) const {
  Uuid id = Uuid::generate();
  while (sessions.count(id)) {
    id = Uuid::generate();
  }
  return id;
}

Result<AuthResponse>
AuthSessionStore::step(const AuthRequest &request) {
  switch (request.step.kind) {
  case AuthStep::Kind::Init:
    if (request.sessionid) {
      return OperationError::invalid_auth_state("init within a session");
    }
    return init(request.step.name, request.step.application);
  case AuthStep::Kind::Creds:
    if (!request.sessionid) {
      return OperationError::invalid_auth_state("credentials without session");
    }
    return creds(*request.sessionid, request.step.credentials);
  }
  return OperationError{OperationError::Kind::InvalidRequestState};
}

Result<AuthResponse>
AuthSessionStore::init(const std::string &principal,
                       const std::optional<std::string> &application) {
  /* the verifier may block, so ask it before taking the lock */
  const std::set<AuthAllowed> required = verifier.required_mechanisms(principal);

  std::lock_guard<std::mutex> lock(mutex);
  const Uuid id = new_sessionid();
  AuthState state = required.empty()
    ? AuthState::make_denied(IDM_AUTH_DENIED_REASON)
    : AuthState::make_continue(remaining(required, {}));

  sessions.emplace(id, Session{ principal, application, state, required, {},
                                now(), false });

  idm_log(IDM_LOG_INFO, "auth session %s: init for %s, %s\n",
          id.str().c_str(), principal.c_str(),
          required.empty() ? "denied" : "continue");
  return AuthResponse{ id, state };
}

Result<AuthResponse>
AuthSessionStore::creds(const Uuid &sessionid,
                        const std::vector<AuthCredential> &creds) {
  std::string principal;
  std::optional<std::string> application;
  std::set<AuthAllowed> required;
  std::set<AuthAllowed> satisfied;

  {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = sessions.find(sessionid);
    if (it == sessions.end()) {
      idm_log(IDM_LOG_INFO, "auth session %s: unknown\n", sessionid.str().c_str());
      return OperationError{OperationError::Kind::InvalidSessionState};
    }

    Session &session = it->second;
    if (session.busy || session.state.terminal()) {
      idm_log(IDM_LOG_INFO, "auth session %s: not in a state to continue\n",
              sessionid.str().c_str());
      return OperationError{OperationError::Kind::InvalidSessionState};
    }
    if (idle(session, now())) {
      session.state = AuthState::make_denied(IDM_AUTH_DENIED_REASON);
      session.last_activity = now();
      idm_log(IDM_LOG_INFO, "auth session %s: expired\n", sessionid.str().c_str());
      return OperationError{OperationError::Kind::InvalidSessionState};
    }

    session.busy = true;
    principal = session.principal;
    application = session.application;
    required = session.required;
    satisfied = session.satisfied;
  }

  /* Clears the busy flag if verify() or the issuer throws. */
  struct Release {
    AuthSessionStore &store;
    const Uuid &sessionid;
    bool done;
    ~Release(void) {
      if (!done) {
        std::lock_guard<std::mutex> lock(store.mutex);
        auto it = store.sessions.find(sessionid);
        if (it != store.sessions.end()) {
          it->second.busy = false;
        }
      }
    }
  } release{ *this, sessionid, false };

  /* Everything below runs without the lock; the busy flag keeps
   * other steps on this session out. */
  const std::vector<AuthAllowed> offered = remaining(required, satisfied);
  bool accepted = !creds.empty();

  for (const auto &c : creds) {
    if (std::find(offered.begin(), offered.end(), c.mechanism()) == offered.end()) {
      accepted = false;
    }
  }
  accepted = accepted && verifier.verify(principal, creds);

  AuthState next = AuthState::make_denied(IDM_AUTH_DENIED_REASON);
  if (accepted) {
    for (const auto &c : creds) {
      satisfied.insert(c.mechanism());
    }
    std::vector<AuthAllowed> left = remaining(required, satisfied);
    if (!left.empty()) {
      next = AuthState::make_continue(left);
    } else if (auto uat = issuer(principal, application)) {
      next = AuthState::make_success(*uat);
    } else {
      idm_log(IDM_LOG_WARNING, "auth session %s: cannot issue token for %s\n",
              sessionid.str().c_str(), principal.c_str());
    }
  }

  std::lock_guard<std::mutex> lock(mutex);
  Session &session = sessions.at(sessionid);
  session.state = next;
  session.satisfied = satisfied;
  session.last_activity = now();
  session.busy = false;
  release.done = true;

  idm_log(IDM_LOG_INFO, "auth session %s: %s\n", sessionid.str().c_str(),
          next.kind == AuthState::Kind::Success ? "success"
          : next.kind == AuthState::Kind::Continue ? "continue" : "denied");
  return AuthResponse{ sessionid, next };
}

std::optional<UserAuthToken>
AuthSessionStore::token(const Uuid &sessionid) const {
  std::lock_guard<std::mutex> lock(mutex);
  auto it = sessions.find(sessionid);
  if ((it == sessions.end())
      || (it->second.state.kind != AuthState::Kind::Success)
      || idle(it->second, now())) {
    return std::nullopt;
  }
  return it->second.state.token;
}

std::optional<AuthState>
AuthSessionStore::state(const Uuid &sessionid) const {
  std::lock_guard<std::mutex> lock(mutex);
  auto it = sessions.find(sessionid);
  if (it == sessions.end()) {
    return std::nullopt;
  }
  return it->second.state;
}

size_t
AuthSessionStore::expire(void) {
  std::lock_guard<std::mutex> lock(mutex);
  const Clock::time_point t = now();
  size_t count = 0;

  for (auto it = sessions.begin(); it != sessions.end(); ) {
    Session &session = it->second;
    if (session.busy || !idle(session, t)) {
      ++it;
      continue;
    }

    count++;
    if (session.state.terminal()) {
      it = sessions.erase(it);
    } else {
      /* keep it for one more window so late steps see a final state */
      session.state = AuthState::make_denied(IDM_AUTH_DENIED_REASON);
      session.last_activity = t;
      ++it;
    }
  }
  if (count) {
    idm_log(IDM_LOG_DEBUG, "expired %zu auth sessions\n", count);
  }
  return count;
}

size_t
AuthSessionStore::size(void) const {
  std::lock_guard<std::mutex> lock(mutex);
  return sessions.size();
}

} /* namespace idm */
