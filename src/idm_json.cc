/*
 * idm_json.cc -- JSON encoding of the protocol values
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#include <cstdlib>
#include <initializer_list>
#include <utility>

#include "idm/idm_debug.hh"
#include "idm/idm_json.hh"

namespace idm {
namespace json {

/* ===== encoding helpers ===== */

/* All helpers consume the references passed to them, also on error. */

static json_t *
str(const std::string &s) {
  return json_stringn(s.data(), s.size());
}

static bool
set(json_t *obj, const char *key, json_t *value) {
  return json_object_set_new(obj, key, value) == 0;
}

static bool
append(json_t *arr, json_t *value) {
  return json_array_append_new(arr, value) == 0;
}

static json_t *
object(std::initializer_list<std::pair<const char *, json_t *> > fields) {
  json_t *obj = json_object();
  bool ok = obj != nullptr;

  for (const auto &f : fields) {
    ok = set(obj, f.first, f.second) && ok;
  }
  if (!ok) {
    json_decref(obj);
    return nullptr;
  }
  return obj;
}

static json_t *
array(std::initializer_list<json_t *> items) {
  json_t *arr = json_array();
  bool ok = arr != nullptr;

  for (json_t *item : items) {
    ok = append(arr, item) && ok;
  }
  if (!ok) {
    json_decref(arr);
    return nullptr;
  }
  return arr;
}

template <typename Container, typename Encoder>
static json_t *
array_of(const Container &items, Encoder enc) {
  json_t *arr = json_array();
  bool ok = arr != nullptr;

  for (const auto &item : items) {
    ok = append(arr, enc(item)) && ok;
  }
  if (!ok) {
    json_decref(arr);
    return nullptr;
  }
  return arr;
}

/* Creates the externally tagged variant {tag: content}. */
static json_t *
tagged(const char *tag, json_t *content) {
  return object({ { tag, content } });
}

static json_t *
optional(const std::optional<std::string> &value) {
  return value ? str(*value) : json_null();
}

/* ===== decoding helpers ===== */

static OperationError
malformed(const char *what) {
  idm_log(IDM_LOG_DEBUG, "json: malformed %s\n", what);
  return OperationError{OperationError::Kind::SerdeJsonError};
}

static bool
get_string(const json_t *j, std::string &out) {
  if (!json_is_string(j)) {
    return false;
  }
  out.assign(json_string_value(j), json_string_length(j));
  return true;
}

static bool
get_pair(const json_t *j, std::string &first, std::string &second) {
  return json_is_array(j) && (json_array_size(j) == 2)
    && get_string(json_array_get(j, 0), first)
    && get_string(json_array_get(j, 1), second);
}

static bool
get_u64(const json_t *j, uint64_t &out) {
  if (!json_is_integer(j) || (json_integer_value(j) < 0)) {
    return false;
  }
  out = static_cast<uint64_t>(json_integer_value(j));
  return true;
}

/*
 * Splits an externally tagged variant into its tag and content. The
 * content of a unit variant is NULL.
 */
static bool
variant(const json_t *j, std::string &tag, const json_t *&content) {
  if (get_string(j, tag)) {
    content = nullptr;
    return true;
  }
  if (json_is_object(j) && (json_object_size(j) == 1)) {
    void *iter = json_object_iter(const_cast<json_t *>(j));
    tag = json_object_iter_key(iter);
    content = json_object_iter_value(iter);
    return true;
  }
  return false;
}

static const json_t *
field(const json_t *obj, const char *key) {
  return json_is_object(obj) ? json_object_get(obj, key) : nullptr;
}

/* Decodes each element of the JSON array j with decode into out. */
template <typename T, typename Decoder>
static Result<void>
decode_array(const json_t *j, std::vector<T> &out, Decoder decode) {
  if (!json_is_array(j)) {
    return malformed("array");
  }
  for (size_t idx = 0; idx < json_array_size(j); idx++) {
    Result<T> item = decode(json_array_get(j, idx));
    if (!item) {
      return item.error();
    }
    out.push_back(std::move(*item));
  }
  return {};
}

/* ===== Filter ===== */

json_t *
encode(const Filter &filter) {
  auto children = [](const Filter &f) {
    return array_of(f.children(), [](const Filter &c) { return encode(c); });
  };

  switch (filter.kind()) {
  case Filter::Kind::Eq:
    return tagged("Eq", array({ str(filter.attribute()), str(filter.value()) }));
  case Filter::Kind::Sub:
    return tagged("Sub", array({ str(filter.attribute()), str(filter.value()) }));
  case Filter::Kind::Pres:
    return tagged("Pres", str(filter.attribute()));
  case Filter::Kind::Or:
    return tagged("Or", children(filter));
  case Filter::Kind::And:
    return tagged("And", children(filter));
  case Filter::Kind::AndNot:
    return tagged("AndNot", encode(filter.children().front()));
  case Filter::Kind::Self:
    /* kept as "Self" for existing consumers */
    return json_string("Self");
  }
  return nullptr;
}

static Result<Filter>
decode_filter_at(const json_t *j, size_t level, size_t max_depth) {
  std::string tag;
  const json_t *content;

  if (level > max_depth) {
    idm_log(IDM_LOG_WARNING, "json: filter nested deeper than %zu\n", max_depth);
    return OperationError{OperationError::Kind::FilterGeneration};
  }
  if (!variant(j, tag, content)) {
    return malformed("filter");
  }

  if (!content) {
    if (tag == "Self") {
      return Filter::make_self();
    }
    return malformed("filter tag");
  }

  if ((tag == "Eq") || (tag == "Sub")) {
    std::string attr, value;
    if (!get_pair(content, attr, value)) {
      return malformed("filter assertion");
    }
    return tag == "Eq" ? Filter::make_eq(attr, value) : Filter::make_sub(attr, value);
  }
  if (tag == "Pres") {
    std::string attr;
    if (!get_string(content, attr)) {
      return malformed("filter presence");
    }
    return Filter::make_pres(attr);
  }
  if ((tag == "Or") || (tag == "And")) {
    Filter::Children children;
    Result<void> res = decode_array(content, children,
                                    [level, max_depth](const json_t *c) {
                                      return decode_filter_at(c, level + 1, max_depth);
                                    });
    if (!res) {
      return res.error();
    }
    return tag == "Or" ? Filter::make_or(children) : Filter::make_and(children);
  }
  if (tag == "AndNot") {
    Result<Filter> child = decode_filter_at(content, level + 1, max_depth);
    if (!child) {
      return child.error();
    }
    return Filter::make_andnot(*child);
  }
  return malformed("filter tag");
}

Result<Filter>
decode_filter(const json_t *j, size_t max_depth) {
  return decode_filter_at(j, 1, max_depth);
}

/* ===== Entry ===== */

json_t *
encode(const Entry &entry) {
  json_t *attrs = json_object();
  bool ok = attrs != nullptr;

  for (const auto &a : entry.attributes()) {
    ok = set(attrs, a.first.c_str(),
             array_of(a.second, [](const std::string &v) { return str(v); })) && ok;
  }
  if (!ok) {
    json_decref(attrs);
    return nullptr;
  }
  return object({ { "attrs", attrs } });
}

Result<Entry>
decode_entry(const json_t *j) {
  const json_t *attrs = field(j, "attrs");
  const char *key;
  json_t *values;
  Attrs result;

  if (!json_is_object(attrs)) {
    return malformed("entry");
  }

  json_object_foreach(const_cast<json_t *>(attrs), key, values) {
    Values &v = result[key];
    Result<void> res = decode_array(values, v, [](const json_t *s) -> Result<std::string> {
        std::string value;
        if (!get_string(s, value)) {
          return malformed("attribute value");
        }
        return value;
      });
    if (!res) {
      return res.error();
    }
  }
  return Entry{std::move(result)};
}

/* ===== Modify ===== */

json_t *
encode(const Modify &mod) {
  if (mod.kind == Modify::Kind::Purged) {
    return tagged(mod.name(), str(mod.attr));
  }
  return tagged(mod.name(), array({ str(mod.attr), str(mod.value) }));
}

Result<Modify>
decode_modify(const json_t *j) {
  std::string tag;
  const json_t *content;
  std::string attr, value;

  if (!variant(j, tag, content) || !content) {
    return malformed("modify");
  }
  if (tag == "Purged") {
    if (!get_string(content, attr)) {
      return malformed("modify purged");
    }
    return Modify::purged(attr);
  }
  if (!get_pair(content, attr, value)) {
    return malformed("modify assertion");
  }
  if (tag == "Present") {
    return Modify::present(attr, value);
  }
  if (tag == "Removed") {
    return Modify::removed(attr, value);
  }
  return malformed("modify tag");
}

json_t *
encode(const ModifyList &modlist) {
  return object({ { "mods", array_of(modlist.mods,
                                     [](const Modify &m) { return encode(m); }) } });
}

Result<ModifyList>
decode_modify_list(const json_t *j) {
  ModifyList modlist;
  Result<void> res = decode_array(field(j, "mods"), modlist.mods, decode_modify);
  if (!res) {
    return res.error();
  }
  return modlist;
}

/* ===== Authentication ===== */

json_t *
encode(AuthAllowed mech) {
  return json_string(auth_allowed_name(mech));
}

Result<AuthAllowed>
decode_auth_allowed(const json_t *j) {
  std::string name;
  if (!get_string(j, name)) {
    return malformed("mechanism");
  }
  if (auto mech = auth_allowed_from_name(name)) {
    return *mech;
  }
  return malformed("mechanism name");
}

json_t *
encode(const AuthCredential &cred) {
  switch (cred.kind) {
  case AuthCredential::Kind::Anonymous:
    return json_string("Anonymous");
  case AuthCredential::Kind::Password:
    return tagged("Password", str(cred.secret));
  }
  return nullptr;
}

Result<AuthCredential>
decode_credential(const json_t *j) {
  std::string tag;
  const json_t *content;

  if (!variant(j, tag, content)) {
    return malformed("credential");
  }
  if ((tag == "Anonymous") && !content) {
    return AuthCredential::anonymous();
  }
  std::string secret;
  if ((tag == "Password") && get_string(content, secret)) {
    return AuthCredential::password(secret);
  }
  return malformed("credential tag");
}

json_t *
encode(const AuthStep &step) {
  switch (step.kind) {
  case AuthStep::Kind::Init:
    return tagged("Init", array({ str(step.name), optional(step.application) }));
  case AuthStep::Kind::Creds:
    return tagged("Creds", array_of(step.credentials,
                                    [](const AuthCredential &c) { return encode(c); }));
  }
  return nullptr;
}

Result<AuthStep>
decode_auth_step(const json_t *j) {
  std::string tag;
  const json_t *content;

  if (!variant(j, tag, content) || !content) {
    return malformed("auth step");
  }
  if (tag == "Init") {
    std::string name, app;
    if (!json_is_array(content) || (json_array_size(content) != 2)
        || !get_string(json_array_get(content, 0), name)) {
      return malformed("auth init");
    }
    const json_t *application = json_array_get(content, 1);
    if (json_is_null(application)) {
      return AuthStep::make_init(name);
    }
    if (!get_string(application, app)) {
      return malformed("auth init application");
    }
    return AuthStep::make_init(name, app);
  }
  if (tag == "Creds") {
    std::vector<AuthCredential> creds;
    Result<void> res = decode_array(content, creds, decode_credential);
    if (!res) {
      return res.error();
    }
    return AuthStep::make_creds(creds);
  }
  return malformed("auth step tag");
}

static json_t *
encode_sessionid(const Uuid &id) {
  return str(id.str());
}

json_t *
encode(const AuthRequest &request) {
  return object({ { "step", encode(request.step) },
                  { "sessionid", request.sessionid
                                   ? encode_sessionid(*request.sessionid)
                                   : json_null() } });
}

static bool
get_sessionid(const json_t *j, Uuid &id) {
  std::string s;
  if (!get_string(j, s)) {
    return false;
  }
  auto parsed = Uuid::parse(s);
  if (!parsed) {
    return false;
  }
  id = *parsed;
  return true;
}

Result<AuthRequest>
decode_auth_request(const json_t *j) {
  Result<AuthStep> step = decode_auth_step(field(j, "step"));
  if (!step) {
    return step.error();
  }

  AuthRequest request{ *step, std::nullopt };
  const json_t *sessionid = field(j, "sessionid");
  if (sessionid && !json_is_null(sessionid)) {
    Uuid id;
    if (!get_sessionid(sessionid, id)) {
      return malformed("session id");
    }
    request.sessionid = id;
  }
  return request;
}

template <typename T>
static json_t *
encode_named(const T &item) {
  return object({ { "name", str(item.name) }, { "uuid", str(item.uuid) } });
}

template <typename T>
static Result<T>
decode_named(const json_t *j) {
  T item;
  if (!get_string(field(j, "name"), item.name)
      || !get_string(field(j, "uuid"), item.uuid)) {
    return malformed("name/uuid pair");
  }
  return item;
}

json_t *
encode(const UserAuthToken &uat) {
  return object({
      { "name", str(uat.name) },
      { "displayname", str(uat.displayname) },
      { "uuid", str(uat.uuid) },
      { "application", uat.application
                         ? encode_named(*uat.application) : json_null() },
      { "groups", array_of(uat.groups, encode_named<Group>) },
      { "claims", array_of(uat.claims, encode_named<Claim>) } });
}

Result<UserAuthToken>
decode_uat(const json_t *j) {
  UserAuthToken uat;

  if (!get_string(field(j, "name"), uat.name)
      || !get_string(field(j, "displayname"), uat.displayname)
      || !get_string(field(j, "uuid"), uat.uuid)) {
    return malformed("token");
  }

  const json_t *app = field(j, "application");
  if (app && !json_is_null(app)) {
    Result<Application> a = decode_named<Application>(app);
    if (!a) {
      return a.error();
    }
    uat.application = *a;
  }

  Result<void> res = decode_array(field(j, "groups"), uat.groups,
                                  decode_named<Group>);
  if (!res) {
    return res.error();
  }
  res = decode_array(field(j, "claims"), uat.claims, decode_named<Claim>);
  if (!res) {
    return res.error();
  }
  return uat;
}

json_t *
encode(const AuthState &state) {
  switch (state.kind) {
  case AuthState::Kind::Success:
    return state.token ? tagged("Success", encode(*state.token)) : nullptr;
  case AuthState::Kind::Denied:
    return tagged("Denied", str(state.reason));
  case AuthState::Kind::Continue:
    return tagged("Continue", array_of(state.allowed,
                                       [](AuthAllowed m) { return encode(m); }));
  }
  return nullptr;
}

Result<AuthState>
decode_auth_state(const json_t *j) {
  std::string tag;
  const json_t *content;

  if (!variant(j, tag, content) || !content) {
    return malformed("auth state");
  }
  if (tag == "Success") {
    Result<UserAuthToken> uat = decode_uat(content);
    if (!uat) {
      return uat.error();
    }
    return AuthState::make_success(*uat);
  }
  if (tag == "Denied") {
    std::string reason;
    if (!get_string(content, reason)) {
      return malformed("denial reason");
    }
    return AuthState::make_denied(reason);
  }
  if (tag == "Continue") {
    std::vector<AuthAllowed> allowed;
    Result<void> res = decode_array(content, allowed, decode_auth_allowed);
    if (!res) {
      return res.error();
    }
    return AuthState::make_continue(allowed);
  }
  return malformed("auth state tag");
}

json_t *
encode(const AuthResponse &response) {
  return object({ { "sessionid", encode_sessionid(response.sessionid) },
                  { "state", encode(response.state) } });
}

Result<AuthResponse>
decode_auth_response(const json_t *j) {
  Uuid id;
  if (!get_sessionid(field(j, "sessionid"), id)) {
    return malformed("session id");
  }
  Result<AuthState> state = decode_auth_state(field(j, "state"));
  if (!state) {
    return state.error();
  }
  return AuthResponse{ id, *state };
}

/* ===== Errors ===== */

json_t *
encode(const SchemaError &err) {
  if (err.kind() == SchemaError::Kind::MissingMustAttribute) {
    return tagged(err.name(), str(err.attribute()));
  }
  return json_string(err.name());
}

std::optional<SchemaError>
decode_schema_error(const json_t *j) {
  std::string tag;
  const json_t *content;

  if (!variant(j, tag, content)) {
    return std::nullopt;
  }
  auto kind = schema_error_kind(tag);
  if (!kind) {
    return std::nullopt;
  }
  if (*kind == SchemaError::Kind::MissingMustAttribute) {
    std::string attr;
    if (!get_string(content, attr)) {
      return std::nullopt;
    }
    return SchemaError::missing_must_attribute(attr);
  }
  if (content) {
    return std::nullopt;
  }
  return SchemaError{*kind};
}

json_t *
encode(const ConsistencyError &err) {
  if (err.kind() == ConsistencyError::Kind::SchemaClassMissingAttribute) {
    return tagged(err.name(), array({ str(err.first()), str(err.second()) }));
  }
  if (err.has_string_payload()) {
    return tagged(err.name(), str(err.first()));
  }
  if (err.has_id_payload()) {
    return tagged(err.name(), json_integer(static_cast<json_int_t>(err.entry_id())));
  }
  return json_string(err.name());
}

std::optional<ConsistencyError>
decode_consistency_error(const json_t *j) {
  using Kind = ConsistencyError::Kind;
  std::string tag;
  const json_t *content;

  if (!variant(j, tag, content)) {
    return std::nullopt;
  }
  auto kind = consistency_error_kind(tag);
  if (!kind) {
    return std::nullopt;
  }

  std::string s1, s2;
  uint64_t id;
  switch (*kind) {
  case Kind::SchemaClassMissingAttribute:
    if (!get_pair(content, s1, s2))
      return std::nullopt;
    return ConsistencyError::schema_class_missing_attribute(s1, s2);
  case Kind::UuidIndexCorrupt:
  case Kind::UuidNotUnique:
  case Kind::InvalidAttributeType:
  case Kind::DuplicateUniqueAttribute:
    if (!get_string(content, s1))
      return std::nullopt;
    if (*kind == Kind::UuidIndexCorrupt)
      return ConsistencyError::uuid_index_corrupt(s1);
    if (*kind == Kind::UuidNotUnique)
      return ConsistencyError::uuid_not_unique(s1);
    if (*kind == Kind::InvalidAttributeType)
      return ConsistencyError::invalid_attribute_type(s1);
    return ConsistencyError::duplicate_unique_attribute(s1);
  case Kind::EntryUuidCorrupt:
  case Kind::RefintNotUpheld:
  case Kind::MemberOfInvalid:
    if (!get_u64(content, id))
      return std::nullopt;
    if (*kind == Kind::EntryUuidCorrupt)
      return ConsistencyError::entry_uuid_corrupt(id);
    if (*kind == Kind::RefintNotUpheld)
      return ConsistencyError::refint_not_upheld(id);
    return ConsistencyError::member_of_invalid(id);
  default:
    if (content)
      return std::nullopt;
    return ConsistencyError{*kind};
  }
}

static json_t *
encode_check(const ConsistencyResult &check) {
  if (check) {
    return tagged("Ok", json_null());
  }
  return tagged("Err", encode(check.error()));
}

json_t *
encode(const OperationError &err) {
  switch (err.kind()) {
  case OperationError::Kind::CorruptedEntry:
    return tagged(err.name(), json_integer(static_cast<json_int_t>(err.entry_id())));
  case OperationError::Kind::SchemaViolation:
    return err.schema_error()
      ? tagged(err.name(), encode(*err.schema_error())) : nullptr;
  case OperationError::Kind::ConsistencyError:
    return tagged(err.name(), array_of(err.consistency_results(), encode_check));
  default:
    if (err.has_string_payload()) {
      return tagged(err.name(), str(err.detail()));
    }
    return json_string(err.name());
  }
}

std::optional<OperationError>
decode_operation_error(const json_t *j) {
  using Kind = OperationError::Kind;
  std::string tag;
  const json_t *content;

  if (!variant(j, tag, content)) {
    return std::nullopt;
  }
  auto kind = operation_error_kind(tag);
  if (!kind) {
    return std::nullopt;
  }

  switch (*kind) {
  case Kind::CorruptedEntry: {
    uint64_t id;
    if (!get_u64(content, id))
      return std::nullopt;
    return OperationError::corrupted_entry(id);
  }
  case Kind::SchemaViolation: {
    auto schema = decode_schema_error(content);
    if (!schema)
      return std::nullopt;
    return OperationError::schema_violation(*schema);
  }
  case Kind::ConsistencyError: {
    std::vector<ConsistencyResult> checks;
    if (!json_is_array(content))
      return std::nullopt;
    for (size_t idx = 0; idx < json_array_size(content); idx++) {
      std::string result;
      const json_t *inner;
      if (!variant(json_array_get(content, idx), result, inner) || !inner)
        return std::nullopt;
      if (result == "Ok" && json_is_null(inner)) {
        checks.emplace_back();
      } else if (result == "Err") {
        auto check = decode_consistency_error(inner);
        if (!check)
          return std::nullopt;
        checks.emplace_back(*check);
      } else {
        return std::nullopt;
      }
    }
    return OperationError::consistency(checks);
  }
  default: {
    std::string detail;
    if (get_string(content, detail)) {
      return OperationError::with_detail(*kind, detail);
    }
    if (content) {
      return std::nullopt;
    }
    OperationError err{*kind};
    if (err.has_string_payload()) {
      return std::nullopt;
    }
    return err;
  }
  }
}

/* ===== Envelopes ===== */

static json_t *
encode_entries(const std::vector<Entry> &entries) {
  return array_of(entries, [](const Entry &e) { return encode(e); });
}

static Result<std::vector<Entry> >
decode_entries(const json_t *j) {
  std::vector<Entry> entries;
  Result<void> res = decode_array(j, entries, decode_entry);
  if (!res) {
    return res.error();
  }
  return entries;
}

json_t *
encode(const OperationResponse &) {
  return json_object();
}

Result<OperationResponse>
decode_operation_response(const json_t *j) {
  if (!json_is_object(j)) {
    return malformed("operation response");
  }
  return OperationResponse{};
}

json_t *
encode(const SearchRequest &request) {
  return object({ { "filter", encode(request.filter) } });
}

Result<SearchRequest>
decode_search_request(const json_t *j, size_t max_depth) {
  Result<Filter> filter = decode_filter(field(j, "filter"), max_depth);
  if (!filter) {
    return filter.error();
  }
  return SearchRequest{ *filter };
}

json_t *
encode(const SearchResponse &response) {
  return object({ { "entries", encode_entries(response.entries) } });
}

Result<SearchResponse>
decode_search_response(const json_t *j) {
  Result<std::vector<Entry> > entries = decode_entries(field(j, "entries"));
  if (!entries) {
    return entries.error();
  }
  return SearchResponse{ *entries };
}

json_t *
encode(const CreateRequest &request) {
  return object({ { "entries", encode_entries(request.entries) } });
}

Result<CreateRequest>
decode_create_request(const json_t *j) {
  Result<std::vector<Entry> > entries = decode_entries(field(j, "entries"));
  if (!entries) {
    return entries.error();
  }
  return CreateRequest{ *entries };
}

json_t *
encode(const DeleteRequest &request) {
  return object({ { "filter", encode(request.filter) } });
}

Result<DeleteRequest>
decode_delete_request(const json_t *j, size_t max_depth) {
  Result<Filter> filter = decode_filter(field(j, "filter"), max_depth);
  if (!filter) {
    return filter.error();
  }
  return DeleteRequest{ *filter };
}

json_t *
encode(const ModifyRequest &request) {
  return object({ { "filter", encode(request.filter) },
                  { "modlist", encode(request.modlist) } });
}

Result<ModifyRequest>
decode_modify_request(const json_t *j, size_t max_depth) {
  Result<Filter> filter = decode_filter(field(j, "filter"), max_depth);
  if (!filter) {
    return filter.error();
  }
  Result<ModifyList> modlist = decode_modify_list(field(j, "modlist"));
  if (!modlist) {
    return modlist.error();
  }
  return ModifyRequest{ *filter, *modlist };
}

json_t *
encode(const SearchRecycledRequest &request) {
  return object({ { "filter", encode(request.filter) } });
}

Result<SearchRecycledRequest>
decode_search_recycled_request(const json_t *j, size_t max_depth) {
  Result<Filter> filter = decode_filter(field(j, "filter"), max_depth);
  if (!filter) {
    return filter.error();
  }
  return SearchRecycledRequest{ *filter };
}

json_t *
encode(const ReviveRecycledRequest &request) {
  return object({ { "filter", encode(request.filter) } });
}

Result<ReviveRecycledRequest>
decode_revive_recycled_request(const json_t *j, size_t max_depth) {
  Result<Filter> filter = decode_filter(field(j, "filter"), max_depth);
  if (!filter) {
    return filter.error();
  }
  return ReviveRecycledRequest{ *filter };
}

json_t *
encode(const WhoamiResponse &response) {
  return object({ { "youare", encode(response.youare) },
                  { "uat", encode(response.uat) } });
}

Result<WhoamiResponse>
decode_whoami_response(const json_t *j) {
  Result<Entry> entry = decode_entry(field(j, "youare"));
  if (!entry) {
    return entry.error();
  }
  Result<UserAuthToken> uat = decode_uat(field(j, "uat"));
  if (!uat) {
    return uat.error();
  }
  return WhoamiResponse{ *entry, *uat };
}

/* ===== Text ===== */

Result<Ptr>
parse(const std::string &text) {
  json_error_t error;
  Ptr j{json_loadb(text.data(), text.size(), 0, &error)};

  if (!j) {
    idm_log(IDM_LOG_DEBUG, "json: %s at line %d, column %d\n",
            error.text, error.line, error.column);
    return OperationError{OperationError::Kind::SerdeJsonError};
  }
  return std::move(j);
}

Result<std::string>
dump(const json_t *j) {
  char *text = j ? json_dumps(j, JSON_COMPACT | JSON_ENCODE_ANY) : nullptr;

  if (!text) {
    return OperationError{OperationError::Kind::SerdeJsonError};
  }
  std::string result{text};
  free(text);
  return result;
}

} /* namespace json */
} /* namespace idm */
