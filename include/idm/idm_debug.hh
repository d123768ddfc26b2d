/*
 * idm_debug.hh -- helper functions for logging and debugging
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#ifndef _IDM_DEBUG_HH
#define _IDM_DEBUG_HH 1

#include <stddef.h>
#include <stdint.h>

/** Pre-defined log levels akin to what is used in \b syslog. */
typedef enum {
  IDM_LOG_EMERG=0,
  IDM_LOG_ALERT,
  IDM_LOG_CRIT,
  IDM_LOG_ERR,
  IDM_LOG_WARNING,
  IDM_LOG_NOTICE,
  IDM_LOG_INFO,
  IDM_LOG_DEBUG
} idm_log_t;

/** Returns the current log level. */
idm_log_t idm_get_log_level(void);

/** Sets the log level to the specified value. */
void idm_set_log_level(idm_log_t level);

typedef void (*idm_log_handler_t) (idm_log_t level, const char *message);

/** Add a custom log callback, use NULL to reset default handler */
void idm_set_log_handler(idm_log_handler_t handler);

#if (defined(__GNUC__))
void idm_log(idm_log_t level,
             const char *format, ...) __attribute__ ((format(printf, 2, 3)));
#else
void idm_log(idm_log_t level, const char *format, ...);
#endif

#endif /* _IDM_DEBUG_HH */
