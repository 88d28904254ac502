#pragma once

#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace reactor::util {

/*
  Wall-clock helpers. Stores keep unix milliseconds; messages carry
  google.protobuf.Timestamp. Cooldown and TTL gates in the runner use
  steady_clock and do not come through here.
*/

uint64_t                    NowMillis();
google::protobuf::Timestamp NowTimestamp();

google::protobuf::Timestamp TimestampFromMillis(uint64_t ms);
// Negative (pre-epoch) timestamps clamp to 0.
uint64_t MillisFromTimestamp(const google::protobuf::Timestamp& ts);

} // namespace reactor::util
