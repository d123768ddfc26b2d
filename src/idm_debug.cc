/*
 * idm_debug.cc -- helper functions for logging and debugging
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

#include "idm/idm_debug.hh"

static idm_log_t maxlog = IDM_LOG_WARNING;
static idm_log_handler_t log_handler = nullptr;
static std::mutex log_mutex;

static const char *loglevels[] = {
  "EMRG", "ALRT", "CRIT", "ERR ", "WARN", "NOTE", "INFO", "DEBG"
};

idm_log_t
idm_get_log_level(void) {
  return maxlog;
}

void
idm_set_log_level(idm_log_t level) {
  maxlog = level;
}

void
idm_set_log_handler(idm_log_handler_t handler) {
  log_handler = handler;
}

static size_t
print_timestamp(char *s, size_t len) {
  time_t now = time(nullptr);
  struct tm tmp;

  if (!localtime_r(&now, &tmp)) {
    return 0;
  }
  return strftime(s, len, "%b %d %H:%M:%S", &tmp);
}

void
idm_log(idm_log_t level, const char *format, ...) {
  char message[512];
  va_list ap;

  if (maxlog < level)
    return;

  va_start(ap, format);
  vsnprintf(message, sizeof(message), format, ap);
  va_end(ap);

  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_handler) {
    log_handler(level, message);
  } else {
    char timebuf[32];
    FILE *log_fd = level <= IDM_LOG_CRIT ? stderr : stdout;

    if (print_timestamp(timebuf, sizeof(timebuf))) {
      fprintf(log_fd, "%s ", timebuf);
    }
    if (level <= IDM_LOG_DEBUG) {
      fprintf(log_fd, "%s ", loglevels[level]);
    }
    fputs(message, log_fd);
    fflush(log_fd);
  }
}
