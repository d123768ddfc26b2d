/*
 * uuid.cc -- 128 bit identifiers for entries and sessions
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#include <ostream>

#include "idm/idm_prng.hh"
#include "idm/uuid.hh"

static inline int
hex2int(char c) {
  if ('0' <= c && c <= '9')
    return c - '0';
  else if ('a' <= c && c <= 'f')
    return c - 'a' + 10;
  else if ('A' <= c && c <= 'F')
    return c - 'A' + 10;
  else
    return -1;
}

namespace idm {

/* positions of the hyphens in the textual representation */
static inline bool
is_hyphen_pos(size_t idx) {
  return idx == 8 || idx == 13 || idx == 18 || idx == 23;
}

Uuid
Uuid::generate(void) {
  bytes_type bytes;

  idm_prng(bytes.data(), bytes.size());
  bytes[6] = (bytes[6] & 0x0f) | 0x40; /* version 4 */
  bytes[8] = (bytes[8] & 0x3f) | 0x80; /* RFC 4122 variant */
  return Uuid{bytes};
}

std::optional<Uuid>
Uuid::parse(const std::string &s) {
  bytes_type bytes;
  size_t n = 0;

  if (s.length() != 36) {
    return std::nullopt;
  }

  for (size_t idx = 0; idx < s.length(); idx++) {
    if (is_hyphen_pos(idx)) {
      if (s[idx] != '-')
        return std::nullopt;
      continue;
    }
    int hi = hex2int(s[idx]);
    int lo = hex2int(s[++idx]);
    if ((hi < 0) || (lo < 0) || is_hyphen_pos(idx)) {
      return std::nullopt;
    }
    bytes[n++] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return Uuid{bytes};
}

bool
Uuid::is_nil(void) const {
  for (auto b : data) {
    if (b)
      return false;
  }
  return true;
}

std::string
Uuid::str(void) const {
  static const char hexdigits[] = "0123456789abcdef";
  std::string result;

  result.reserve(36);
  for (size_t idx = 0; idx < data.size(); idx++) {
    if (idx == 4 || idx == 6 || idx == 8 || idx == 10) {
      result.push_back('-');
    }
    result.push_back(hexdigits[data[idx] >> 4]);
    result.push_back(hexdigits[data[idx] & 0x0f]);
  }
  return result;
}

std::ostream &
operator<<(std::ostream &os, const Uuid &uuid) {
  return os << uuid.str();
}

} /* namespace idm */
