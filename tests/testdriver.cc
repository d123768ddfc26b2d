/*
 * testdriver.cc -- IDM unit tests
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>
#include "test.hh"

#include <cstdio>
#include <cstring>
#include <random>

/* Generate none deterministic "random" values.*/
static void
rnd(uint8_t *out, size_t len) {
  static std::random_device rd;
  static std::seed_seq seed{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
  static std::mt19937 generate(seed);
  using rand_t = uint16_t;
  static std::uniform_int_distribution<rand_t> rand;

  while (len) {
    rand_t v = rand(generate);
    size_t count = std::min(len, sizeof(rand_t));
    memcpy(out, &v, count);
    len -= count;
    out += count;
  }
}

std::string
test_uuid(unsigned int n) {
  char buf[37];
  snprintf(buf, sizeof(buf), "00000000-0000-4000-8000-%012x", n);
  return buf;
}

void test_log_off(void) {
  idm_set_log_level(IDM_LOG_CRIT);
}

void test_log_on(void) {
  idm_set_log_level(IDM_LOG_WARNING);
}

int main(int argc, char* argv[]) {
  test_log_on();
  idm_set_prng(rnd);
  int result = Catch::Session().run( argc, argv );

  return result;
}
