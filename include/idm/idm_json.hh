/*
 * idm_json.hh -- JSON encoding of the protocol values
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#ifndef _IDM_JSON_HH
#define _IDM_JSON_HH 1

#include <memory>
#include <optional>
#include <string>

#include <jansson.h>

#include "idm/auth.hh"
#include "idm/entry.hh"
#include "idm/error.hh"
#include "idm/filter.hh"
#include "idm/modify.hh"
#include "idm/proto.hh"

/*
 * Every enum variant is tagged by its name and every struct field by
 * its name. Unit variants are encoded as a plain string ("Self",
 * "Anonymous"), variants with one field as {"Tag": value} and
 * variants with several fields as {"Tag": [values...]}. Optional
 * values are null when absent.
 */

namespace idm {
namespace json {

struct Deleter {
  void operator()(json_t *p) { json_decref(p); }
};

using Ptr = std::unique_ptr<json_t, Deleter>;

/*
 * The encoders return a new reference, or NULL if the value cannot
 * be represented (e.g., a string that is not valid UTF-8).
 */
json_t *encode(const Filter &filter);
json_t *encode(const Entry &entry);
json_t *encode(const Modify &mod);
json_t *encode(const ModifyList &modlist);
json_t *encode(AuthAllowed mech);
json_t *encode(const AuthCredential &cred);
json_t *encode(const AuthStep &step);
json_t *encode(const AuthRequest &request);
json_t *encode(const UserAuthToken &uat);
json_t *encode(const AuthState &state);
json_t *encode(const AuthResponse &response);
json_t *encode(const SchemaError &err);
json_t *encode(const ConsistencyError &err);
json_t *encode(const OperationError &err);
json_t *encode(const OperationResponse &response);
json_t *encode(const SearchRequest &request);
json_t *encode(const SearchResponse &response);
json_t *encode(const CreateRequest &request);
json_t *encode(const DeleteRequest &request);
json_t *encode(const ModifyRequest &request);
json_t *encode(const SearchRecycledRequest &request);
json_t *encode(const ReviveRecycledRequest &request);
json_t *encode(const WhoamiResponse &response);

/*
 * The decoders return OperationError::SerdeJsonError for malformed
 * input. Filters nested deeper than max_depth are rejected with
 * OperationError::FilterGeneration.
 */
Result<Filter> decode_filter(const json_t *j, size_t max_depth = IDM_FILTER_MAX_DEPTH);
Result<Entry> decode_entry(const json_t *j);
Result<Modify> decode_modify(const json_t *j);
Result<ModifyList> decode_modify_list(const json_t *j);
Result<AuthAllowed> decode_auth_allowed(const json_t *j);
Result<AuthCredential> decode_credential(const json_t *j);
Result<AuthStep> decode_auth_step(const json_t *j);
Result<AuthRequest> decode_auth_request(const json_t *j);
Result<UserAuthToken> decode_uat(const json_t *j);
Result<AuthState> decode_auth_state(const json_t *j);
Result<AuthResponse> decode_auth_response(const json_t *j);
Result<OperationResponse> decode_operation_response(const json_t *j);
Result<SearchRequest> decode_search_request(const json_t *j,
                                            size_t max_depth = IDM_FILTER_MAX_DEPTH);
Result<SearchResponse> decode_search_response(const json_t *j);
Result<CreateRequest> decode_create_request(const json_t *j);
Result<DeleteRequest> decode_delete_request(const json_t *j,
                                            size_t max_depth = IDM_FILTER_MAX_DEPTH);
Result<ModifyRequest> decode_modify_request(const json_t *j,
                                            size_t max_depth = IDM_FILTER_MAX_DEPTH);
Result<SearchRecycledRequest> decode_search_recycled_request(const json_t *j,
                                            size_t max_depth = IDM_FILTER_MAX_DEPTH);
Result<ReviveRecycledRequest> decode_revive_recycled_request(const json_t *j,
                                            size_t max_depth = IDM_FILTER_MAX_DEPTH);
Result<WhoamiResponse> decode_whoami_response(const json_t *j);

/* Errors are decoded into std::nullopt if malformed. */
std::optional<SchemaError> decode_schema_error(const json_t *j);
std::optional<ConsistencyError> decode_consistency_error(const json_t *j);
std::optional<OperationError> decode_operation_error(const json_t *j);

/** Parses @p text into a JSON value. */
Result<Ptr> parse(const std::string &text);

/** Returns the compact textual form of @p j. */
Result<std::string> dump(const json_t *j);

template <typename T>
Result<std::string> serialize(const T &value) {
  Ptr j{encode(value)};
  if (!j) {
    return OperationError{OperationError::Kind::SerdeJsonError};
  }
  return dump(j.get());
}

/**
 * Parses @p text and hands the result to @p decode, a callable taking
 * a const json_t * and returning Result<T>.
 */
template <typename T, typename Decoder>
Result<T> deserialize(const std::string &text, Decoder decode) {
  Result<Ptr> j = parse(text);
  if (!j) {
    return j.error();
  }
  return decode(j->get());
}

} /* namespace json */
} /* namespace idm */

#endif /* _IDM_JSON_HH */
