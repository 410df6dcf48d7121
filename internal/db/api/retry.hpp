#pragma once

#include <chrono>
#include <string_view>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace graphingest::db {

inline constexpr int kMaxConflictRetries = 5;

/*
  Runs fn, which must open and commit its own transaction, again whenever the
  commit loses against a concurrent writer, backing off linearly. The last
  conflict propagates.
*/
template <typename Fn>
auto RetryOnConflict(std::string_view operation, Fn&& fn) -> decltype(fn()) {
  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const util::TransactionConflict& e) {
      if (attempt >= kMaxConflictRetries) {
        throw;
      }
      GRAPHINGEST_LOG_DEBUG("transaction conflict, retrying",
                            {observability::StringField("operation", operation), observability::IntField("attempt", attempt),
                             observability::StringField("error", e.what())});
      std::this_thread::sleep_for(std::chrono::milliseconds(attempt));
    }
  }
}

} // namespace graphingest::db
