#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace procdb::util {

/*
  Time utilities. Single place to control the timestamp representation and the
  text form timestamps take on the wire.

  Microsecond ticks match PostgreSQL's own precision and span every year from
  0001 to 9999 (a nanosecond system_clock tick only covers 1677 to 2262).
*/

using TimePoint = std::chrono::sys_time<std::chrono::microseconds>;

uint64_t ToUnixMillis(TimePoint tp);

// "YYYY-MM-DD HH:MM:SS.ffffff+00" (UTC, microsecond precision).
std::string FormatIsoTimestamp(TimePoint tp);

// Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS[.fraction][(+|-)HH[:MM]]" and the
// 'T' separated form. A missing offset means UTC. Throws CoercionError.
TimePoint ParseIsoTimestamp(std::string_view text);

} // namespace procdb::util
