/*
 * memory_backend.hh -- in-memory storage and filter evaluation
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#ifndef _IDM_MEMORY_BACKEND_HH
#define _IDM_MEMORY_BACKEND_HH 1

#include <map>
#include <mutex>
#include <string>

#include <stdint.h>

#include "idm/backend.hh"

namespace idm {

/**
 * Checks whether @p entry matches @p filter. SelfUUID never matches;
 * it must be resolved before evaluation.
 */
bool matches(const Filter &filter, const Entry &entry);

class MemoryBackend : public Backend {
public:
  MemoryBackend(void) = default;
  MemoryBackend(const MemoryBackend &) = delete;
  MemoryBackend &operator=(const MemoryBackend &) = delete;

  Result<Entries> evaluate(const Filter &filter) const override;
  Result<Entries> evaluate_recycled(const Filter &filter) const override;
  Result<void> create(const Entries &entries) override;
  Result<void> replace(const Entries &entries) override;
  Result<size_t> modify(const Filter &filter, const Modifier &modifier) override;
  Result<void> recycle(const Entries &entries) override;
  Result<void> revive(const Entries &entries) override;
  std::vector<ConsistencyResult> verify(void) const override;

  /** Number of live entries. */
  size_t size(void) const;

private:
  struct Stored {
    uint64_t id;
    Entry entry;
  };
  /* both sets are keyed by the uuid the entry was stored with */
  using Store = std::map<std::string, Stored>;

  mutable std::mutex mutex;
  uint64_t next_id = 1;
  Store live;
  Store recycled;

  static Entries select(const Store &store, const Filter &filter);
  static Result<void> move(Store &from, Store &to, const Entries &entries);
};

} /* namespace idm */

#endif /* _IDM_MEMORY_BACKEND_HH */
