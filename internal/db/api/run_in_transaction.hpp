#pragma once

#include <functional>
#include <string>

#include "internal/db/api/repository.hpp"

namespace dispatch::db {

constexpr int kDefaultTransactionAttempts = 3;

/*
  Runs fn inside a fresh transaction and commits it.

  A util::Conflict from Commit() (another writer won the optimistic race)
  re-runs fn against a new snapshot, up to max_attempts times. Any other
  exception rolls back and propagates.
*/
void RunInTransaction(Repository& repo, const std::function<void(Transaction&)>& fn, int max_attempts = kDefaultTransactionAttempts);

// Translates a non-OK Result into the matching util exception.
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace dispatch::db
