#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace checkout::util {

/*
  Wall clock helpers.

  Rows store epoch milliseconds; the API exposes google.protobuf.Timestamp.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

google::protobuf::Timestamp ToProto(TimePoint tp);

// Row timestamp straight to the wire type.
google::protobuf::Timestamp MillisToProto(uint64_t ms);

} // namespace checkout::util
