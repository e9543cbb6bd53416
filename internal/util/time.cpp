#include "time.hpp"

#include <cstdio>

#include "internal/util/errors.hpp"

namespace procdb::util {

namespace {

[[noreturn]] void BadTimestamp(std::string_view text) {
  throw CoercionError("invalid timestamp '" + std::string(text) + "'");
}

int ReadDigits(std::string_view text, std::size_t& pos, std::size_t width) {
  if (pos + width > text.size()) BadTimestamp(text);
  int value = 0;
  for (std::size_t i = 0; i < width; ++i) {
    const char c = text[pos + i];
    if (c < '0' || c > '9') BadTimestamp(text);
    value = value * 10 + (c - '0');
  }
  pos += width;
  return value;
}

void Expect(std::string_view text, std::size_t& pos, char expected) {
  if (pos >= text.size() || text[pos] != expected) BadTimestamp(text);
  ++pos;
}

} // namespace

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string FormatIsoTimestamp(TimePoint tp) {
  using namespace std::chrono;

  const auto                   midnight = floor<days>(tp);
  const year_month_day         ymd{midnight};
  const hh_mm_ss<microseconds> hms{tp - midnight};

  char buffer[48];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u %02lld:%02lld:%02lld.%06lld+00",
                static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                static_cast<long long>(hms.hours().count()), static_cast<long long>(hms.minutes().count()),
                static_cast<long long>(hms.seconds().count()), static_cast<long long>(hms.subseconds().count()));
  return buffer;
}

TimePoint ParseIsoTimestamp(std::string_view text) {
  using namespace std::chrono;

  std::size_t pos = 0;
  const int   y   = ReadDigits(text, pos, 4);
  Expect(text, pos, '-');
  const int mo = ReadDigits(text, pos, 2);
  Expect(text, pos, '-');
  const int d = ReadDigits(text, pos, 2);

  const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) BadTimestamp(text);

  TimePoint tp = sys_days{ymd};
  if (pos == text.size()) return tp;

  if (text[pos] != ' ' && text[pos] != 'T') BadTimestamp(text);
  ++pos;

  const int h = ReadDigits(text, pos, 2);
  Expect(text, pos, ':');
  const int mi = ReadDigits(text, pos, 2);
  Expect(text, pos, ':');
  const int s = ReadDigits(text, pos, 2);
  if (h > 23 || mi > 59 || s > 60) BadTimestamp(text);
  tp += hours{h} + minutes{mi} + seconds{s};

  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int64_t micros = 0;
    int     digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      // digits past microseconds are dropped
      if (digits < 6) {
        micros = micros * 10 + (text[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    if (digits == 0) BadTimestamp(text);
    for (; digits < 6; ++digits) micros *= 10;
    tp += microseconds{micros};
  }

  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    const int sign = text[pos] == '-' ? -1 : 1;
    ++pos;
    const int offset_hours   = ReadDigits(text, pos, 2);
    int       offset_minutes = 0;
    if (pos < text.size()) {
      if (text[pos] == ':') ++pos;
      offset_minutes = ReadDigits(text, pos, 2);
    }
    tp -= sign * (hours{offset_hours} + minutes{offset_minutes});
  } else if (pos < text.size() && text[pos] == 'Z') {
    ++pos;
  }

  if (pos != text.size()) BadTimestamp(text);
  return tp;
}

} // namespace procdb::util
