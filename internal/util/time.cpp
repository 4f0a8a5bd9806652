#include "time.hpp"

namespace arena::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  const auto since_epoch = tp.time_since_epoch();
  const auto seconds     = std::chrono::floor<std::chrono::seconds>(since_epoch);

  google::protobuf::Timestamp ts;
  ts.set_seconds(seconds.count());
  ts.set_nanos(static_cast<int32_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds).count()));
  return ts;
}

uint64_t ToUnixMillis(TimePoint tp) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms))};
}

double ElapsedMs(SteadyClock::time_point since) {
  return std::chrono::duration<double, std::milli>(SteadyClock::now() - since).count();
}

} // namespace arena::util
