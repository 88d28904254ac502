#include "time.hpp"

#include <google/protobuf/util/time_util.h>

namespace reactor::util {

using google::protobuf::util::TimeUtil;

uint64_t NowMillis() {
  return MillisFromTimestamp(TimeUtil::GetCurrentTime());
}

google::protobuf::Timestamp NowTimestamp() {
  return TimeUtil::GetCurrentTime();
}

google::protobuf::Timestamp TimestampFromMillis(uint64_t ms) {
  return TimeUtil::MillisecondsToTimestamp(static_cast<int64_t>(ms));
}

uint64_t MillisFromTimestamp(const google::protobuf::Timestamp& ts) {
  const int64_t ms = TimeUtil::TimestampToMilliseconds(ts);
  return ms < 0 ? 0 : static_cast<uint64_t>(ms);
}

} // namespace reactor::util
