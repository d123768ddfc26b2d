/*
 * test.hh -- common declarations for IDM unit tests
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#ifndef TEST_HH_
#define TEST_HH_

#include <memory>
#include <string>

#include <jansson.h>

#include "idm/idm.hh"
#include "idm/accounts.hh"
#include "idm/idm_json.hh"
#include "idm/memory_backend.hh"
#include "idm/schema.hh"

/* Helper structure to simplify deletion of library objects in smart
 * pointers. */
struct Deleter {
  /* objects from external libraries used for testing */
  void operator()(json_t *p) { json_decref(p); }
};

using json_ptr = std::unique_ptr<json_t, Deleter>;

void test_log_off(void);
void test_log_on(void);

/* A fixed uuid whose last byte is n. */
std::string test_uuid(unsigned int n);

#endif /* TEST_HH_ */
