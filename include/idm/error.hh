/*
 * error.hh -- error taxonomy for schema, consistency and operation
 *             failures
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#ifndef _IDM_ERROR_HH
#define _IDM_ERROR_HH 1

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include <stdint.h>

#include "idm/result.hh"

namespace idm {

/** Violations of the entry shape as checked by the schema. */
class SchemaError {
public:
  enum class Kind : uint8_t {
    NotImplemented,
    InvalidClass,
    MissingMustAttribute,
    InvalidAttribute,
    InvalidAttributeSyntax,
    EmptyFilter,
    Corrupted
  };

  SchemaError(Kind k) : kind_(k) {}

  static SchemaError missing_must_attribute(const std::string &attr);

  Kind kind(void) const { return kind_; }

  /** The attribute name carried by MissingMustAttribute. */
  const std::string &attribute(void) const { return attr; }

  /** Returns the variant name, e.g. "InvalidClass". */
  const char *name(void) const;

  bool operator==(const SchemaError &other) const {
    return kind_ == other.kind_ && attr == other.attr;
  }
  bool operator!=(const SchemaError &other) const { return !(*this == other); }

private:
  Kind kind_;
  std::string attr;
};

/** Structural integrity faults found by a consistency check. */
class ConsistencyError {
public:
  enum class Kind : uint8_t {
    Unknown,
    SchemaClassMissingAttribute, /* class, attribute */
    QueryServerSearchFailure,
    EntryUuidCorrupt,            /* entry id */
    UuidIndexCorrupt,            /* uuid */
    UuidNotUnique,               /* uuid */
    RefintNotUpheld,             /* entry id */
    MemberOfInvalid,             /* entry id */
    InvalidAttributeType,        /* attribute */
    DuplicateUniqueAttribute     /* attribute */
  };

  ConsistencyError(Kind k) : kind_(k), id(0) {}

  static ConsistencyError schema_class_missing_attribute(const std::string &cls,
                                                         const std::string &attr);
  static ConsistencyError entry_uuid_corrupt(uint64_t entry_id);
  static ConsistencyError uuid_index_corrupt(const std::string &uuid);
  static ConsistencyError uuid_not_unique(const std::string &uuid);
  static ConsistencyError refint_not_upheld(uint64_t entry_id);
  static ConsistencyError member_of_invalid(uint64_t entry_id);
  static ConsistencyError invalid_attribute_type(const std::string &attr);
  static ConsistencyError duplicate_unique_attribute(const std::string &attr);

  Kind kind(void) const { return kind_; }
  const char *name(void) const;

  /**
   * The string payloads. For SchemaClassMissingAttribute, first() is
   * the class and second() the attribute. Variants with a single
   * string payload use first().
   */
  const std::string &first(void) const { return s1; }
  const std::string &second(void) const { return s2; }

  /** The numeric payload of the variants that carry an entry id. */
  uint64_t entry_id(void) const { return id; }

  bool has_string_payload(void) const;
  bool has_id_payload(void) const;

  bool operator==(const ConsistencyError &other) const {
    return kind_ == other.kind_ && s1 == other.s1 && s2 == other.s2
      && id == other.id;
  }
  bool operator!=(const ConsistencyError &other) const { return !(*this == other); }

private:
  Kind kind_;
  std::string s1;
  std::string s2;
  uint64_t id;
};

/** The outcome of a single consistency check. */
using ConsistencyResult = Result<void, ConsistencyError>;

/** The top-level error returned by every operation. */
class OperationError {
public:
  enum class Kind : uint8_t {
    EmptyRequest,
    Backend,
    NoMatchingEntries,
    CorruptedEntry,          /* entry id */
    ConsistencyError,        /* list of check results */
    SchemaViolation,         /* SchemaError */
    Plugin,
    FilterGeneration,
    FilterUUIDResolution,
    InvalidAttributeName,    /* string */
    InvalidAttribute,        /* string */
    InvalidDBState,
    InvalidEntryID,
    InvalidRequestState,
    InvalidState,
    InvalidEntryState,
    InvalidUuid,
    InvalidACPState,         /* string */
    InvalidSchemaState,      /* string */
    InvalidAccountState,     /* string */
    BackendEngine,
    SQLiteError,
    FsError,
    SerdeJsonError,
    SerdeCborError,
    AccessDenied,
    NotAuthenticated,
    InvalidAuthState,        /* string */
    InvalidSessionState,
    SystemProtectedObject
  };

  OperationError(Kind k) : kind_(k), id(0) {}

  static OperationError corrupted_entry(uint64_t entry_id);
  static OperationError consistency(const std::vector<ConsistencyResult> &results);
  static OperationError schema_violation(const SchemaError &err);
  static OperationError invalid_attribute_name(const std::string &attr);
  static OperationError invalid_attribute(const std::string &what);
  static OperationError invalid_acp_state(const std::string &what);
  static OperationError invalid_schema_state(const std::string &what);
  static OperationError invalid_account_state(const std::string &what);
  static OperationError invalid_auth_state(const std::string &what);

  /**
   * Creates the variant @p k with the string payload @p what. Returns
   * std::nullopt if @p k does not carry a string.
   */
  static std::optional<OperationError> with_detail(Kind k, const std::string &what);

  Kind kind(void) const { return kind_; }
  const char *name(void) const;

  const std::string &detail(void) const { return text; }
  uint64_t entry_id(void) const { return id; }
  const std::optional<SchemaError> &schema_error(void) const { return schema; }
  const std::vector<ConsistencyResult> &consistency_results(void) const {
    return checks;
  }

  bool has_string_payload(void) const;

  bool operator==(const OperationError &other) const {
    return kind_ == other.kind_ && text == other.text && id == other.id
      && schema == other.schema && checks == other.checks;
  }
  bool operator!=(const OperationError &other) const { return !(*this == other); }

private:
  Kind kind_;
  std::string text;
  uint64_t id;
  std::optional<SchemaError> schema;
  std::vector<ConsistencyResult> checks;
};

/** Looks up a variant by name. These are used by the wire codec. */
std::optional<SchemaError::Kind> schema_error_kind(const std::string &name);
std::optional<ConsistencyError::Kind> consistency_error_kind(const std::string &name);
std::optional<OperationError::Kind> operation_error_kind(const std::string &name);

std::ostream &operator<<(std::ostream &os, const SchemaError &err);
std::ostream &operator<<(std::ostream &os, const ConsistencyError &err);
std::ostream &operator<<(std::ostream &os, const OperationError &err);

} /* namespace idm */

#endif /* _IDM_ERROR_HH */
