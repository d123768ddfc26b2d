/*
 * memory_backend.cc -- in-memory storage and filter evaluation
 *
 * Copyright (C) 2019-2021 The libidm authors
 *
 * This file is part of the IDM library libidm. Please see README
 * for terms of use.
 */

#include <algorithm>
#include <set>
#include <utility>
#include <vector>

#include "idm/idm_debug.hh"
#include "idm/memory_backend.hh"
#include "idm/uuid.hh"

namespace idm {

bool
matches(const Filter &filter, const Entry &entry) {
  switch (filter.kind()) {
  case Filter::Kind::Eq:
    return entry.equals(filter.attribute(), filter.value());
  case Filter::Kind::Sub:
    return entry.contains(filter.attribute(), filter.value());
  case Filter::Kind::Pres:
    return entry.present(filter.attribute());
  case Filter::Kind::Or:
    return std::any_of(filter.children().begin(), filter.children().end(),
                       [&entry](const Filter &f) { return matches(f, entry); });
  case Filter::Kind::And:
    return std::all_of(filter.children().begin(), filter.children().end(),
                       [&entry](const Filter &f) { return matches(f, entry); });
  case Filter::Kind::AndNot:
    return !matches(filter.children().front(), entry);
  case Filter::Kind::Self:
  default:
    return false;
  }
}

Entries
MemoryBackend::select(const Store &store, const Filter &filter) {
  Entries result;
  for (const auto &s : store) {
    if (matches(filter, s.second.entry)) {
      result.push_back(s.second.entry);
    }
  }
  return result;
}

Result<Entries>
MemoryBackend::evaluate(const Filter &filter) const {
  std::lock_guard<std::mutex> lock(mutex);
  return select(live, filter);
}

Result<Entries>
MemoryBackend::evaluate_recycled(const Filter &filter) const {
  std::lock_guard<std::mutex> lock(mutex);
  return select(recycled, filter);
}

Result<void>
MemoryBackend::create(const Entries &entries) {
  std::lock_guard<std::mutex> lock(mutex);
  std::set<std::string> batch;

  /* check all entries first so that a failed create changes nothing */
  for (const auto &e : entries) {
    auto uuid = e.uuid();
    if (!uuid) {
      idm_log(IDM_LOG_WARNING, "cannot store entry without uuid\n");
      return OperationError{OperationError::Kind::InvalidEntryState};
    }
    if (live.count(*uuid) || recycled.count(*uuid) || !batch.insert(*uuid).second) {
      idm_log(IDM_LOG_NOTICE, "uuid %s is not unique\n", uuid->c_str());
      return OperationError::consistency({ ConsistencyError::uuid_not_unique(*uuid) });
    }
  }

  for (const auto &e : entries) {
    live.emplace(*e.uuid(), Stored{ next_id++, e });
  }
  idm_log(IDM_LOG_DEBUG, "created %zu entries\n", entries.size());
  return {};
}

Result<void>
MemoryBackend::replace(const Entries &entries) {
  std::lock_guard<std::mutex> lock(mutex);

  for (const auto &e : entries) {
    auto uuid = e.uuid();
    if (!uuid || !live.count(*uuid)) {
      return OperationError{OperationError::Kind::InvalidEntryID};
    }
  }
  for (const auto &e : entries) {
    live.at(*e.uuid()).entry = e;
  }
  return {};
}

Result<size_t>
MemoryBackend::modify(const Filter &filter, const Modifier &modifier) {
  std::lock_guard<std::mutex> lock(mutex);
  std::vector<std::pair<Stored *, Entry> > changes;

  for (auto &s : live) {
    if (!matches(filter, s.second.entry)) {
      continue;
    }
    Result<Entry> entry = modifier(s.second.entry);
    if (!entry) {
      return entry.error();
    }
    if (entry->uuid() != std::optional<std::string>(s.first)) {
      idm_log(IDM_LOG_WARNING, "modification of %s changes its uuid\n", s.first.c_str());
      return OperationError{OperationError::Kind::InvalidEntryState};
    }
    changes.emplace_back(&s.second, std::move(*entry));
  }

  for (auto &c : changes) {
    c.first->entry = std::move(c.second);
  }
  return changes.size();
}

Result<void>
MemoryBackend::move(Store &from, Store &to, const Entries &entries) {
  for (const auto &e : entries) {
    auto uuid = e.uuid();
    if (!uuid || !from.count(*uuid)) {
      return OperationError{OperationError::Kind::InvalidEntryID};
    }
  }
  for (const auto &e : entries) {
    auto it = from.find(*e.uuid());
    to.insert(*it);
    from.erase(it);
  }
  return {};
}

Result<void>
MemoryBackend::recycle(const Entries &entries) {
  std::lock_guard<std::mutex> lock(mutex);
  return move(live, recycled, entries);
}

Result<void>
MemoryBackend::revive(const Entries &entries) {
  std::lock_guard<std::mutex> lock(mutex);
  return move(recycled, live, entries);
}

size_t
MemoryBackend::size(void) const {
  std::lock_guard<std::mutex> lock(mutex);
  return live.size();
}

/* Appends Ok if check found nothing, otherwise the faults. */
static void
report(std::vector<ConsistencyResult> &results,
       const std::vector<ConsistencyError> &faults) {
  if (faults.empty()) {
    results.emplace_back();
  } else {
    results.insert(results.end(), faults.begin(), faults.end());
  }
}

std::vector<ConsistencyResult>
MemoryBackend::verify(void) const {
  std::lock_guard<std::mutex> lock(mutex);
  std::vector<ConsistencyResult> results;
  std::vector<ConsistencyError> faults;

  /* every entry carries the well-formed uuid it is indexed by */
  for (const Store *store : { &live, &recycled }) {
    for (const auto &s : *store) {
      auto uuid = s.second.entry.uuid();
      if (!uuid || !Uuid::parse(*uuid)) {
        faults.push_back(ConsistencyError::entry_uuid_corrupt(s.second.id));
      } else if (*uuid != s.first) {
        faults.push_back(ConsistencyError::uuid_index_corrupt(s.first));
      }
    }
  }
  report(results, faults);
  faults.clear();

  /* a uuid is either live or recycled */
  for (const auto &s : live) {
    if (recycled.count(s.first)) {
      faults.push_back(ConsistencyError::uuid_not_unique(s.first));
    }
  }
  report(results, faults);
  faults.clear();

  /* members refer to live entries */
  for (const auto &s : live) {
    const Values *members = s.second.entry.get("member");
    if (members && std::any_of(members->begin(), members->end(),
                               [this](const std::string &m) {
                                 return live.count(m) == 0;
                               })) {
      faults.push_back(ConsistencyError::refint_not_upheld(s.second.id));
    }
  }
  report(results, faults);
  faults.clear();

  /* memberof is the inverse of member */
  for (const auto &s : live) {
    const Values *groups = s.second.entry.get("memberof");
    if (!groups) {
      continue;
    }
    for (const auto &g : *groups) {
      auto group = live.find(g);
      if ((group == live.end())
          || !group->second.entry.equals("member", s.first)) {
        faults.push_back(ConsistencyError::member_of_invalid(s.second.id));
        break;
      }
    }
  }
  report(results, faults);

  return results;
}

} /* namespace idm */
