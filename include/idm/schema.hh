/*
 * schema.hh -- object classes and attribute rules
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#ifndef _IDM_SCHEMA_HH
#define _IDM_SCHEMA_HH 1

#include <map>
#include <set>
#include <string>

#include "idm/backend.hh"

namespace idm {

struct SchemaClass {
  std::string name;
  std::set<std::string> must;
  std::set<std::string> may;
};

/**
 * A schema made of object classes. An entry is valid if it names at
 * least one known class in its "class" attribute, carries every
 * attribute its classes require, and carries no attribute that none
 * of its classes allow. The system attributes "class" and "uuid" are
 * allowed for all classes.
 */
class Schema : public SchemaValidator {
public:
  /** Adds or replaces the class @p cls. */
  void add_class(const SchemaClass &cls);

  const SchemaClass *find_class(const std::string &name) const;
  size_t size(void) const { return classes.size(); }

  Result<void, SchemaError> validate(const Entry &entry) const override;

  /** Checks attribute names: lower case letters, digits and '_'. */
  static bool valid_attribute_name(const std::string &name);

private:
  std::map<std::string, SchemaClass> classes;
};

/** Returns the classes used by the reference directory layout. */
Schema core_schema(void);

} /* namespace idm */

#endif /* _IDM_SCHEMA_HH */
