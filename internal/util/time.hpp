#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "google/protobuf/timestamp.pb.h"

namespace batch::util {

/*
  Wall-clock helpers. Job timestamps are system_clock; persisted as unix
  millis where 0 stands for "never happened".
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

uint64_t                 ToUnixMillis(const std::optional<TimePoint>& tp);
std::optional<TimePoint> OptionalFromUnixMillis(uint64_t ms);

} // namespace batch::util
