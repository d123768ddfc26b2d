/*
 * schema.cc -- object classes and attribute rules
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#include <cctype>

#include "idm/idm_debug.hh"
#include "idm/schema.hh"
#include "idm/uuid.hh"

namespace idm {

static const std::set<std::string> systemAttributes = { "class", "uuid" };

void
Schema::add_class(const SchemaClass &cls) {
  idm_log(IDM_LOG_DEBUG, "schema: class %s (%zu must, %zu may)\n",
          cls.name.c_str(), cls.must.size(), cls.may.size());
  classes[cls.name] = cls;
}

const SchemaClass *
Schema::find_class(const std::string &name) const {
  auto it = classes.find(name);
  return it != classes.end() ? &it->second : nullptr;
}

bool
Schema::valid_attribute_name(const std::string &name) {
  if (name.empty() || !islower(static_cast<unsigned char>(name[0]))) {
    return false;
  }
  for (unsigned char c : name) {
    if (!islower(c) && !isdigit(c) && (c != '_')) {
      return false;
    }
  }
  return true;
}

Result<void, SchemaError>
Schema::validate(const Entry &entry) const {
  const Values *names = entry.get("class");
  if (!names || names->empty()) {
    return SchemaError{SchemaError::Kind::InvalidClass};
  }

  std::set<std::string> allowed{systemAttributes};
  for (const auto &n : *names) {
    const SchemaClass *cls = find_class(n);
    if (!cls) {
      idm_log(IDM_LOG_INFO, "schema: unknown class %s\n", n.c_str());
      return SchemaError{SchemaError::Kind::InvalidClass};
    }
    for (const auto &attr : cls->must) {
      if (!entry.present(attr)) {
        return SchemaError::missing_must_attribute(attr);
      }
    }
    allowed.insert(cls->must.begin(), cls->must.end());
    allowed.insert(cls->may.begin(), cls->may.end());
  }

  for (const auto &a : entry.attributes()) {
    if (!valid_attribute_name(a.first)) {
      return SchemaError{SchemaError::Kind::InvalidAttributeSyntax};
    }
    if (!allowed.count(a.first)) {
      idm_log(IDM_LOG_INFO, "schema: attribute %s not allowed\n", a.first.c_str());
      return SchemaError{SchemaError::Kind::InvalidAttribute};
    }
    if (a.second.empty()) {
      return SchemaError{SchemaError::Kind::Corrupted};
    }
  }

  const Values *uuids = entry.get("uuid");
  if (uuids && ((uuids->size() != 1) || !Uuid::parse(uuids->front()))) {
    return SchemaError{SchemaError::Kind::InvalidAttributeSyntax};
  }
  return {};
}

Schema
core_schema(void) {
  Schema schema;

  schema.add_class({ "object", {}, { "description" } });
  schema.add_class({ "person", { "name", "displayname" },
                     { "mail", "memberof", "description" } });
  schema.add_class({ "account", { "name" },
                     { "displayname", "memberof", "description" } });
  schema.add_class({ "group", { "name" },
                     { "member", "memberof", "description" } });
  schema.add_class({ "application", { "name" }, { "description" } });
  return schema;
}

} /* namespace idm */
