/*
 * idm.hh -- main header file for libidm
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#ifndef _IDM_HH
#define _IDM_HH 1

/** The default port for unencrypted IDM traffic. */
#define IDM_DEFAULT_COAP_PORT      7743

/** The query parameter that carries an authenticated session id. */
#define IDM_SESSION_QUERY          "session="

#include "idm/idm_debug.hh"
#include "idm/idm_prng.hh"

#include "idm/result.hh"
#include "idm/error.hh"
#include "idm/uuid.hh"
#include "idm/entry.hh"
#include "idm/filter.hh"
#include "idm/modify.hh"
#include "idm/auth.hh"
#include "idm/proto.hh"
#include "idm/backend.hh"
#include "idm/auth_session.hh"
#include "idm/server.hh"

#endif /* _IDM_HH */
