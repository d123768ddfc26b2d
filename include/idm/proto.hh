/*
 * proto.hh -- request and response envelopes of the v1 protocol
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#ifndef _IDM_PROTO_HH
#define _IDM_PROTO_HH 1

#include <vector>

#include "idm/auth.hh"
#include "idm/entry.hh"
#include "idm/filter.hh"
#include "idm/modify.hh"

namespace idm {

/* The empty acknowledgement of create, delete, modify and revive. */
struct OperationResponse {
  bool operator==(const OperationResponse &) const { return true; }
};

struct SearchRequest {
  Filter filter;
};

struct SearchResponse {
  std::vector<Entry> entries;
};

struct CreateRequest {
  std::vector<Entry> entries;
};

struct DeleteRequest {
  Filter filter;
};

struct ModifyRequest {
  Filter filter;
  ModifyList modlist;
};

/* Only search and revive are possible on recycled entries. */
struct SearchRecycledRequest {
  Filter filter;
};

struct ReviveRecycledRequest {
  Filter filter;
};

/* Whoami has no payload; the caller is known from its token. */
struct WhoamiRequest {
};

struct WhoamiResponse {
  Entry youare;
  UserAuthToken uat;
};

} /* namespace idm */

#endif /* _IDM_PROTO_HH */
