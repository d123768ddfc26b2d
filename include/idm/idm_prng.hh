/*
 * idm_prng.hh -- random number generation
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#ifndef _IDM_PRNG_HH
#define _IDM_PRNG_HH 1

#include <stddef.h>
#include <stdint.h>

typedef void (*idm_rand_func_t)(uint8_t *out, size_t len);

/**
 * Replaces the random number generator used for session identifiers
 * and entry uuids. Passing NULL restores the built-in generator.
 */
void idm_set_prng(idm_rand_func_t rng);

/** Fills @p out with @p len random bytes. */
void idm_prng(uint8_t *out, size_t len);

#endif /* _IDM_PRNG_HH */
