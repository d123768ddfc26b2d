/*
 * idm_prng.cc -- random number generation
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#include <algorithm>
#include <cstring>
#include <mutex>
#include <random>

#include "idm/idm_prng.hh"

static std::mutex prng_mutex;

static void
default_rnd(uint8_t *out, size_t len) {
  static std::random_device rd;
  static std::seed_seq seed{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
  static std::mt19937 generate(seed);
  using rand_t = uint32_t;
  static std::uniform_int_distribution<rand_t> rand;

  while (len) {
    rand_t v = rand(generate);
    size_t count = std::min(len, sizeof(rand_t));
    memcpy(out, &v, count);
    len -= count;
    out += count;
  }
}

static idm_rand_func_t rand_func = default_rnd;

void
idm_set_prng(idm_rand_func_t rng) {
  std::lock_guard<std::mutex> lock(prng_mutex);
  rand_func = rng ? rng : default_rnd;
}

void
idm_prng(uint8_t *out, size_t len) {
  std::lock_guard<std::mutex> lock(prng_mutex);
  rand_func(out, len);
}
