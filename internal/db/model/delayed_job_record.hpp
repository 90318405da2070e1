#pragma once

#include <cstdint>
#include <string>

namespace checkout::db::model {

/*
  Persistent delayed job.

  id is deterministic per logical job (e.g. "cancel-payment-42"); upserting
  the same id replaces the pending job instead of adding a second one.
*/
struct DelayedJobRecord {
  std::string id;
  std::string type;
  std::string payload;  // JSON

  uint64_t run_at_ms     = 0;
  uint32_t attempts      = 0;
  uint64_t created_at_ms = 0;
};

} // namespace checkout::db::model
