#include "time.hpp"

namespace batch::util {

namespace {

using Millis = std::chrono::milliseconds;

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  const auto since_epoch = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch());
  const auto seconds     = std::chrono::floor<std::chrono::seconds>(since_epoch);

  google::protobuf::Timestamp ts;
  ts.set_seconds(seconds.count());
  ts.set_nanos(static_cast<int32_t>((since_epoch - seconds).count()));
  return ts;
}

uint64_t ToUnixMillis(TimePoint tp) {
  return static_cast<uint64_t>(std::chrono::duration_cast<Millis>(tp.time_since_epoch()).count());
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint(std::chrono::duration_cast<Clock::duration>(Millis(ms)));
}

uint64_t ToUnixMillis(const std::optional<TimePoint>& tp) {
  return tp ? ToUnixMillis(*tp) : 0;
}

std::optional<TimePoint> OptionalFromUnixMillis(uint64_t ms) {
  if (ms == 0) return std::nullopt;
  return FromUnixMillis(ms);
}

} // namespace batch::util
