/*
 * auth.hh -- authentication steps, states and the user token
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#ifndef _IDM_AUTH_HH
#define _IDM_AUTH_HH 1

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include <stdint.h>

#include "idm/uuid.hh"

namespace idm {

struct Group {
  std::string name;
  std::string uuid;

  bool operator==(const Group &o) const { return name == o.name && uuid == o.uuid; }
};

/* Claims are ephemeral, session scoped attributes. */
struct Claim {
  std::string name;
  std::string uuid;

  bool operator==(const Claim &o) const { return name == o.name && uuid == o.uuid; }
};

struct Application {
  std::string name;
  std::string uuid;

  bool operator==(const Application &o) const {
    return name == o.name && uuid == o.uuid;
  }
};

/**
 * The identity of an authenticated user together with the data
 * needed to authorise it. A token is only created as the result of
 * a successful authentication and is bound to the session that
 * issued it.
 */
struct UserAuthToken {
  std::string name;
  std::string displayname;
  std::string uuid;
  std::optional<Application> application;
  std::vector<Group> groups;
  std::vector<Claim> claims;

  bool operator==(const UserAuthToken &o) const {
    return name == o.name && displayname == o.displayname && uuid == o.uuid
      && application == o.application && groups == o.groups
      && claims == o.claims;
  }
  bool operator!=(const UserAuthToken &o) const { return !(*this == o); }
};

/** Credential mechanisms the server may offer. */
enum class AuthAllowed : uint8_t { Anonymous, Password };

const char *auth_allowed_name(AuthAllowed mech);
std::optional<AuthAllowed> auth_allowed_from_name(const std::string &name);

/** A credential submitted by the client. */
struct AuthCredential {
  enum class Kind : uint8_t { Anonymous, Password };

  Kind kind;
  std::string secret;         /* the password for Kind::Password */

  static AuthCredential anonymous(void) {
    return AuthCredential{ Kind::Anonymous, std::string() };
  }
  static AuthCredential password(const std::string &pw) {
    return AuthCredential{ Kind::Password, pw };
  }

  /** The mechanism this credential belongs to. */
  AuthAllowed mechanism(void) const;

  bool operator==(const AuthCredential &o) const {
    return kind == o.kind && secret == o.secret;
  }
};

/**
 * A client step. The client first names the principal with Init and
 * then submits credentials with Creds until the server reports
 * Success or Denied.
 */
struct AuthStep {
  enum class Kind : uint8_t { Init, Creds };

  Kind kind;
  std::string name;                         /* Init */
  std::optional<std::string> application;   /* Init */
  std::vector<AuthCredential> credentials;  /* Creds */

  static AuthStep make_init(const std::string &principal,
                            const std::optional<std::string> &app = std::nullopt) {
    return AuthStep{ Kind::Init, principal, app, {} };
  }
  static AuthStep make_creds(const std::vector<AuthCredential> &creds) {
    return AuthStep{ Kind::Creds, std::string(), std::nullopt, creds };
  }

  bool operator==(const AuthStep &o) const {
    return kind == o.kind && name == o.name && application == o.application
      && credentials == o.credentials;
  }
};

/** The server's answer to an AuthStep. */
struct AuthState {
  enum class Kind : uint8_t { Success, Denied, Continue };

  Kind kind;
  std::optional<UserAuthToken> token;   /* Success */
  std::string reason;                   /* Denied */
  std::vector<AuthAllowed> allowed;     /* Continue */

  static AuthState make_success(const UserAuthToken &uat) {
    return AuthState{ Kind::Success, uat, std::string(), {} };
  }
  static AuthState make_denied(const std::string &why) {
    return AuthState{ Kind::Denied, std::nullopt, why, {} };
  }
  static AuthState make_continue(const std::vector<AuthAllowed> &mechs) {
    return AuthState{ Kind::Continue, std::nullopt, std::string(), mechs };
  }

  bool terminal(void) const { return kind != Kind::Continue; }

  bool operator==(const AuthState &o) const {
    return kind == o.kind && token == o.token && reason == o.reason
      && allowed == o.allowed;
  }
};

/**
 * A step addressed to the server. Creds must carry the session id
 * that Init returned, Init must not carry one.
 */
struct AuthRequest {
  AuthStep step;
  std::optional<Uuid> sessionid;
};

struct AuthResponse {
  Uuid sessionid;
  AuthState state;
};

std::ostream &operator<<(std::ostream &os, const UserAuthToken &uat);
std::ostream &operator<<(std::ostream &os, const AuthState &state);

} /* namespace idm */

#endif /* _IDM_AUTH_HH */
