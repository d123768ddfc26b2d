/*
 * uuid.hh -- 128 bit identifiers for entries and sessions
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#ifndef _IDM_UUID_HH
#define _IDM_UUID_HH 1

#include <array>
#include <iosfwd>
#include <optional>
#include <string>

#include <stdint.h>

namespace idm {

class Uuid {
public:
  using bytes_type = std::array<uint8_t, 16>;

  /** Creates the nil uuid. */
  Uuid(void) : data{} {}
  explicit Uuid(const bytes_type &bytes) : data(bytes) {}

  /** Creates a random (version 4) uuid from idm_prng(). */
  static Uuid generate(void);

  /**
   * Parses the hyphenated textual form
   * xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx. Upper and lower case hex
   * digits are accepted.
   */
  static std::optional<Uuid> parse(const std::string &s);

  bool is_nil(void) const;
  const bytes_type &bytes(void) const { return data; }

  /** Returns the lower case hyphenated form. */
  std::string str(void) const;

  bool operator==(const Uuid &other) const { return data == other.data; }
  bool operator!=(const Uuid &other) const { return data != other.data; }
  bool operator<(const Uuid &other) const { return data < other.data; }

private:
  bytes_type data;
};

std::ostream &operator<<(std::ostream &os, const Uuid &uuid);

} /* namespace idm */

#endif /* _IDM_UUID_HH */
