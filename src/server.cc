/*
 * server.cc -- dispatch of protocol requests to the backend
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#include <algorithm>

#include "idm/idm_debug.hh"
#include "idm/server.hh"
#include "idm/uuid.hh"

namespace idm {

QueryServer::QueryServer(Backend &b, const SchemaValidator &s,
                         const CredentialVerifier &verifier,
                         std::chrono::seconds session_timeout,
                         size_t max_filter_depth)
  : backend(b), schema(s),
    auth(verifier,
         [this](const std::string &principal,
                const std::optional<std::string> &application) {
           return issue_token(principal, application);
         },
         session_timeout),
    max_depth(std::clamp<size_t>(max_filter_depth, 1, IDM_FILTER_DEPTH_LIMIT)) {
}

Result<Filter>
QueryServer::prepare(const Filter &filter,
                     const std::optional<UserAuthToken> &uat) const {
  Result<Filter> canonical = canonicalize(filter, max_depth);
  if (!canonical || !canonical->contains_self()) {
    return canonical;
  }

  if (!uat) {
    idm_log(IDM_LOG_INFO, "cannot resolve SelfUUID without token\n");
    return OperationError{OperationError::Kind::FilterUUIDResolution};
  }
  /* the substituted term may sort differently */
  return canonicalize(canonical->resolve_self(uat->uuid), max_depth);
}

Result<Filter>
QueryServer::prepare_change(const Filter &filter,
                            const std::optional<UserAuthToken> &uat) const {
  Result<Filter> canonical = prepare(filter, uat);
  if (canonical && canonical->is_always_false()) {
    return OperationError::schema_violation(SchemaError::Kind::EmptyFilter);
  }
  return canonical;
}

Result<SearchResponse>
QueryServer::handle_search(const SearchRequest &request,
                           const std::optional<UserAuthToken> &uat) {
  Result<Filter> filter = prepare(request.filter, uat);
  if (!filter) {
    return filter.error();
  }
  if (filter->is_always_false()) {
    return SearchResponse{};
  }

  Result<Entries> entries = backend.evaluate(*filter);
  if (!entries) {
    return entries.error();
  }
  idm_log(IDM_LOG_DEBUG, "search returned %zu entries\n", entries->size());
  return SearchResponse{ std::move(*entries) };
}

Result<SearchResponse>
QueryServer::handle_search_recycled(const SearchRecycledRequest &request,
                                    const std::optional<UserAuthToken> &uat) {
  Result<Filter> filter = prepare(request.filter, uat);
  if (!filter) {
    return filter.error();
  }
  if (filter->is_always_false()) {
    return SearchResponse{};
  }

  Result<Entries> entries = backend.evaluate_recycled(*filter);
  if (!entries) {
    return entries.error();
  }
  return SearchResponse{ std::move(*entries) };
}

Result<OperationResponse>
QueryServer::handle_create(const CreateRequest &request,
                           const std::optional<UserAuthToken> &uat) {
  if (!uat) {
    return OperationError{OperationError::Kind::NotAuthenticated};
  }
  if (request.entries.empty()) {
    return OperationError{OperationError::Kind::EmptyRequest};
  }

  Entries entries;
  for (const auto &e : request.entries) {
    Uuid id;
    if (auto uuid = e.uuid()) {
      auto parsed = Uuid::parse(*uuid);
      if (!parsed || (e.get("uuid")->size() != 1)) {
        idm_log(IDM_LOG_INFO, "create: invalid uuid %s\n", uuid->c_str());
        return OperationError{OperationError::Kind::InvalidUuid};
      }
      id = *parsed;
    } else {
      id = Uuid::generate();
    }

    Entry entry = e.with("uuid", { id.str() });
    Result<void, SchemaError> valid = schema.validate(entry);
    if (!valid) {
      idm_log(IDM_LOG_INFO, "create: entry %s violates schema\n", id.str().c_str());
      return OperationError::schema_violation(valid.error());
    }
    entries.push_back(std::move(entry));
  }

  Result<void> res = backend.create(entries);
  if (!res) {
    return res.error();
  }
  idm_log(IDM_LOG_INFO, "%s created %zu entries\n", uat->name.c_str(), entries.size());
  return OperationResponse{};
}

Result<OperationResponse>
QueryServer::handle_delete(const DeleteRequest &request,
                           const std::optional<UserAuthToken> &uat) {
  if (!uat) {
    return OperationError{OperationError::Kind::NotAuthenticated};
  }

  Result<Filter> filter = prepare_change(request.filter, uat);
  if (!filter) {
    return filter.error();
  }
  Result<Entries> entries = backend.evaluate(*filter);
  if (!entries) {
    return entries.error();
  }
  if (entries->empty()) {
    return OperationError{OperationError::Kind::NoMatchingEntries};
  }

  Result<void> res = backend.recycle(*entries);
  if (!res) {
    return res.error();
  }
  idm_log(IDM_LOG_INFO, "%s recycled %zu entries\n", uat->name.c_str(), entries->size());
  return OperationResponse{};
}

Result<OperationResponse>
QueryServer::handle_modify(const ModifyRequest &request,
                           const std::optional<UserAuthToken> &uat) {
  if (!uat) {
    return OperationError{OperationError::Kind::NotAuthenticated};
  }
  if (request.modlist.empty()) {
    return OperationError{OperationError::Kind::EmptyRequest};
  }
  if (request.modlist.touches("uuid")) {
    return OperationError{OperationError::Kind::SystemProtectedObject};
  }

  Result<Filter> filter = prepare_change(request.filter, uat);
  if (!filter) {
    return filter.error();
  }
  const ModifyList &modlist = request.modlist;
  const SchemaValidator &validator = schema;
  Result<size_t> count =
    backend.modify(*filter, [&modlist, &validator](const Entry &e) -> Result<Entry> {
        Entry entry = modlist.apply(e);
        Result<void, SchemaError> valid = validator.validate(entry);
        if (!valid) {
          return OperationError::schema_violation(valid.error());
        }
        return entry;
      });
  if (!count) {
    return count.error();
  }
  if (*count == 0) {
    return OperationError{OperationError::Kind::NoMatchingEntries};
  }
  idm_log(IDM_LOG_INFO, "%s modified %zu entries\n", uat->name.c_str(), *count);
  return OperationResponse{};
}

Result<OperationResponse>
QueryServer::handle_revive_recycled(const ReviveRecycledRequest &request,
                                    const std::optional<UserAuthToken> &uat) {
  if (!uat) {
    return OperationError{OperationError::Kind::NotAuthenticated};
  }

  Result<Filter> filter = prepare_change(request.filter, uat);
  if (!filter) {
    return filter.error();
  }
  Result<Entries> entries = backend.evaluate_recycled(*filter);
  if (!entries) {
    return entries.error();
  }
  if (entries->empty()) {
    return OperationError{OperationError::Kind::NoMatchingEntries};
  }

  Result<void> res = backend.revive(*entries);
  if (!res) {
    return res.error();
  }
  idm_log(IDM_LOG_INFO, "%s revived %zu entries\n", uat->name.c_str(), entries->size());
  return OperationResponse{};
}

Result<AuthResponse>
QueryServer::handle_auth(const AuthRequest &request) {
  return auth.step(request);
}

Result<WhoamiResponse>
QueryServer::handle_whoami(const WhoamiRequest &,
                           const std::optional<UserAuthToken> &uat) {
  if (!uat) {
    return OperationError{OperationError::Kind::NotAuthenticated};
  }

  Result<Entries> entries = backend.evaluate(Filter::make_eq("uuid", uat->uuid));
  if (!entries) {
    return entries.error();
  }
  if (entries->empty()) {
    return OperationError{OperationError::Kind::NoMatchingEntries};
  }
  return WhoamiResponse{ entries->front(), *uat };
}

std::optional<UserAuthToken>
QueryServer::session_token(const Uuid &sessionid) const {
  return auth.token(sessionid);
}

Result<void>
QueryServer::verify(void) const {
  std::vector<ConsistencyResult> results = backend.verify();

  if (std::all_of(results.begin(), results.end(),
                  [](const ConsistencyResult &r) { return r.ok(); })) {
    return {};
  }
  idm_log(IDM_LOG_WARNING, "consistency check failed\n");
  return OperationError::consistency(results);
}

std::optional<UserAuthToken>
QueryServer::issue_token(const std::string &principal,
                         const std::optional<std::string> &application) const {
  Result<Entries> found = backend.evaluate(Filter::make_eq("name", principal));
  if (!found || (found->size() != 1) || !found->front().uuid()) {
    idm_log(IDM_LOG_WARNING, "no unique entry for principal %s\n", principal.c_str());
    return std::nullopt;
  }

  const Entry &entry = found->front();
  UserAuthToken uat;
  uat.name = principal;
  uat.displayname = entry.first("displayname").value_or(principal);
  uat.uuid = *entry.uuid();

  if (const Values *groups = entry.get("memberof")) {
    for (const auto &g : *groups) {
      Result<Entries> group = backend.evaluate(
        Filter::make_and({ Filter::make_eq("class", "group"),
                           Filter::make_eq("uuid", g) }));
      if (group && !group->empty()) {
        uat.groups.push_back(Group{ group->front().first("name").value_or(g), g });
      }
    }
  }

  if (application) {
    Result<Entries> app = backend.evaluate(
      Filter::make_and({ Filter::make_eq("class", "application"),
                         Filter::make_eq("name", *application) }));
    if (!app || app->empty() || !app->front().uuid()) {
      idm_log(IDM_LOG_NOTICE, "unknown application %s\n", application->c_str());
      return std::nullopt;
    }
    uat.application = Application{ *application, *app->front().uuid() };
  }

  return uat;
}

} /* namespace idm */
