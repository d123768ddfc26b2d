/*
 * error.cc -- error taxonomy for schema, consistency and operation
 *             failures
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#include <iomanip>
#include <ostream>

#include "idm/error.hh"

namespace idm {

static const char *schemaErrorNames[] = {
  "NotImplemented", "InvalidClass", "MissingMustAttribute",
  "InvalidAttribute", "InvalidAttributeSyntax", "EmptyFilter", "Corrupted"
};

static const char *consistencyErrorNames[] = {
  "Unknown", "SchemaClassMissingAttribute", "QueryServerSearchFailure",
  "EntryUuidCorrupt", "UuidIndexCorrupt", "UuidNotUnique",
  "RefintNotUpheld", "MemberOfInvalid", "InvalidAttributeType",
  "DuplicateUniqueAttribute"
};

static const char *operationErrorNames[] = {
  "EmptyRequest", "Backend", "NoMatchingEntries", "CorruptedEntry",
  "ConsistencyError", "SchemaViolation", "Plugin", "FilterGeneration",
  "FilterUUIDResolution", "InvalidAttributeName", "InvalidAttribute",
  "InvalidDBState", "InvalidEntryID", "InvalidRequestState",
  "InvalidState", "InvalidEntryState", "InvalidUuid", "InvalidACPState",
  "InvalidSchemaState", "InvalidAccountState", "BackendEngine",
  "SQLiteError", "FsError", "SerdeJsonError", "SerdeCborError",
  "AccessDenied", "NotAuthenticated", "InvalidAuthState",
  "InvalidSessionState", "SystemProtectedObject"
};

template <typename Kind, size_t N>
static std::optional<Kind>
find_kind(const char *(&names)[N], const std::string &name) {
  for (size_t idx = 0; idx < N; idx++) {
    if (name == names[idx]) {
      return static_cast<Kind>(idx);
    }
  }
  return std::nullopt;
}

/* ===== SchemaError ===== */

SchemaError
SchemaError::missing_must_attribute(const std::string &a) {
  SchemaError err{Kind::MissingMustAttribute};
  err.attr = a;
  return err;
}

const char *
SchemaError::name(void) const {
  return schemaErrorNames[static_cast<size_t>(kind_)];
}

std::optional<SchemaError::Kind>
schema_error_kind(const std::string &name) {
  return find_kind<SchemaError::Kind>(schemaErrorNames, name);
}

std::ostream &
operator<<(std::ostream &os, const SchemaError &err) {
  os << err.name();
  if (err.kind() == SchemaError::Kind::MissingMustAttribute) {
    os << '(' << std::quoted(err.attribute()) << ')';
  }
  return os;
}

/* ===== ConsistencyError ===== */

ConsistencyError
ConsistencyError::schema_class_missing_attribute(const std::string &cls,
                                                 const std::string &attr) {
  ConsistencyError err{Kind::SchemaClassMissingAttribute};
  err.s1 = cls;
  err.s2 = attr;
  return err;
}

ConsistencyError
ConsistencyError::entry_uuid_corrupt(uint64_t entry_id) {
  ConsistencyError err{Kind::EntryUuidCorrupt};
  err.id = entry_id;
  return err;
}

ConsistencyError
ConsistencyError::uuid_index_corrupt(const std::string &uuid) {
  ConsistencyError err{Kind::UuidIndexCorrupt};
  err.s1 = uuid;
  return err;
}

ConsistencyError
ConsistencyError::uuid_not_unique(const std::string &uuid) {
  ConsistencyError err{Kind::UuidNotUnique};
  err.s1 = uuid;
  return err;
}

ConsistencyError
ConsistencyError::refint_not_upheld(uint64_t entry_id) {
  ConsistencyError err{Kind::RefintNotUpheld};
  err.id = entry_id;
  return err;
}

ConsistencyError
ConsistencyError::member_of_invalid(uint64_t entry_id) {
  ConsistencyError err{Kind::MemberOfInvalid};
  err.id = entry_id;
  return err;
}

ConsistencyError
ConsistencyError::invalid_attribute_type(const std::string &attr) {
  ConsistencyError err{Kind::InvalidAttributeType};
  err.s1 = attr;
  return err;
}

ConsistencyError
ConsistencyError::duplicate_unique_attribute(const std::string &attr) {
  ConsistencyError err{Kind::DuplicateUniqueAttribute};
  err.s1 = attr;
  return err;
}

const char *
ConsistencyError::name(void) const {
  return consistencyErrorNames[static_cast<size_t>(kind_)];
}

bool
ConsistencyError::has_string_payload(void) const {
  switch (kind_) {
  case Kind::SchemaClassMissingAttribute:
  case Kind::UuidIndexCorrupt:
  case Kind::UuidNotUnique:
  case Kind::InvalidAttributeType:
  case Kind::DuplicateUniqueAttribute:
    return true;
  default:
    return false;
  }
}

bool
ConsistencyError::has_id_payload(void) const {
  switch (kind_) {
  case Kind::EntryUuidCorrupt:
  case Kind::RefintNotUpheld:
  case Kind::MemberOfInvalid:
    return true;
  default:
    return false;
  }
}

std::optional<ConsistencyError::Kind>
consistency_error_kind(const std::string &name) {
  return find_kind<ConsistencyError::Kind>(consistencyErrorNames, name);
}

std::ostream &
operator<<(std::ostream &os, const ConsistencyError &err) {
  os << err.name();
  if (err.kind() == ConsistencyError::Kind::SchemaClassMissingAttribute) {
    os << '(' << std::quoted(err.first()) << ", " << std::quoted(err.second()) << ')';
  } else if (err.has_string_payload()) {
    os << '(' << std::quoted(err.first()) << ')';
  } else if (err.has_id_payload()) {
    os << '(' << err.entry_id() << ')';
  }
  return os;
}

/* ===== OperationError ===== */

OperationError
OperationError::corrupted_entry(uint64_t entry_id) {
  OperationError err{Kind::CorruptedEntry};
  err.id = entry_id;
  return err;
}

OperationError
OperationError::consistency(const std::vector<ConsistencyResult> &results) {
  OperationError err{Kind::ConsistencyError};
  err.checks = results;
  return err;
}

OperationError
OperationError::schema_violation(const SchemaError &schema_err) {
  OperationError err{Kind::SchemaViolation};
  err.schema = schema_err;
  return err;
}

OperationError
OperationError::invalid_attribute_name(const std::string &attr) {
  return *with_detail(Kind::InvalidAttributeName, attr);
}

OperationError
OperationError::invalid_attribute(const std::string &what) {
  return *with_detail(Kind::InvalidAttribute, what);
}

OperationError
OperationError::invalid_acp_state(const std::string &what) {
  return *with_detail(Kind::InvalidACPState, what);
}

OperationError
OperationError::invalid_schema_state(const std::string &what) {
  return *with_detail(Kind::InvalidSchemaState, what);
}

OperationError
OperationError::invalid_account_state(const std::string &what) {
  return *with_detail(Kind::InvalidAccountState, what);
}

OperationError
OperationError::invalid_auth_state(const std::string &what) {
  return *with_detail(Kind::InvalidAuthState, what);
}

std::optional<OperationError>
OperationError::with_detail(Kind k, const std::string &what) {
  OperationError err{k};
  if (!err.has_string_payload()) {
    return std::nullopt;
  }
  err.text = what;
  return err;
}

const char *
OperationError::name(void) const {
  return operationErrorNames[static_cast<size_t>(kind_)];
}

bool
OperationError::has_string_payload(void) const {
  switch (kind_) {
  case Kind::InvalidAttributeName:
  case Kind::InvalidAttribute:
  case Kind::InvalidACPState:
  case Kind::InvalidSchemaState:
  case Kind::InvalidAccountState:
  case Kind::InvalidAuthState:
    return true;
  default:
    return false;
  }
}

std::optional<OperationError::Kind>
operation_error_kind(const std::string &name) {
  return find_kind<OperationError::Kind>(operationErrorNames, name);
}

std::ostream &
operator<<(std::ostream &os, const OperationError &err) {
  os << err.name();
  switch (err.kind()) {
  case OperationError::Kind::CorruptedEntry:
    os << '(' << err.entry_id() << ')';
    break;
  case OperationError::Kind::SchemaViolation:
    if (err.schema_error()) {
      os << '(' << *err.schema_error() << ')';
    }
    break;
  case OperationError::Kind::ConsistencyError: {
    const char *sep = "";
    os << "([";
    for (const auto &check : err.consistency_results()) {
      os << sep;
      if (check) {
        os << "Ok(())";
      } else {
        os << "Err(" << check.error() << ')';
      }
      sep = ", ";
    }
    os << "])";
    break;
  }
  default:
    if (err.has_string_payload()) {
      os << '(' << std::quoted(err.detail()) << ')';
    }
  }
  return os;
}

} /* namespace idm */
