/*
 * result.hh -- value-or-error return type
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#ifndef _IDM_RESULT_HH
#define _IDM_RESULT_HH 1

#include <optional>
#include <utility>

namespace idm {

class OperationError;

/**
 * Holds either the value of a successful operation or the error that
 * made it fail. Errors are data: nothing in libidm throws across its
 * API.
 */
template <typename T, typename E = OperationError>
class Result {
public:
  Result(const T &v) : val(v) {}
  Result(T &&v) : val(std::move(v)) {}
  Result(const E &e) : err(e) {}
  Result(E &&e) : err(std::move(e)) {}

  bool ok(void) const { return !err.has_value(); }
  explicit operator bool(void) const { return ok(); }

  const T &value(void) const { return *val; }
  T &value(void) { return *val; }
  const T &operator*(void) const { return *val; }
  T &operator*(void) { return *val; }
  const T *operator->(void) const { return &*val; }
  T *operator->(void) { return &*val; }

  const E &error(void) const { return *err; }

  bool operator==(const Result &other) const {
    return (val == other.val) && (err == other.err);
  }
  bool operator!=(const Result &other) const { return !(*this == other); }

private:
  std::optional<T> val;
  std::optional<E> err;
};

template <typename E>
class Result<void, E> {
public:
  Result(void) {}
  Result(const E &e) : err(e) {}
  Result(E &&e) : err(std::move(e)) {}

  bool ok(void) const { return !err.has_value(); }
  explicit operator bool(void) const { return ok(); }

  const E &error(void) const { return *err; }

  bool operator==(const Result &other) const { return err == other.err; }
  bool operator!=(const Result &other) const { return !(*this == other); }

private:
  std::optional<E> err;
};

} /* namespace idm */

#endif /* _IDM_RESULT_HH */
