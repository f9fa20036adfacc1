#include "time.hpp"

#include <cstdio>

namespace edgestore::util {

namespace {

bool ReadDigits(std::string_view text, std::size_t pos, std::size_t count, int& out) {
  if (pos + count > text.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    const char c = text[i];
    if (c < '0' || c > '9') {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  out = value;
  return true;
}

bool Expect(std::string_view text, std::size_t pos, char c) {
  return pos < text.size() && text[pos] == c;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

std::int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::int64_t NowMillis() {
  return ToUnixMillis(Now());
}

std::optional<std::int64_t> ParseIso8601Millis(std::string_view text) {
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  if (!ReadDigits(text, 0, 4, year) || !Expect(text, 4, '-') || !ReadDigits(text, 5, 2, month) || !Expect(text, 7, '-') ||
      !ReadDigits(text, 8, 2, day)) {
    return std::nullopt;
  }
  if (!(Expect(text, 10, 'T') || Expect(text, 10, ' ')) || !ReadDigits(text, 11, 2, hour) || !Expect(text, 13, ':') ||
      !ReadDigits(text, 14, 2, minute) || !Expect(text, 16, ':') || !ReadDigits(text, 17, 2, second)) {
    return std::nullopt;
  }
  if (hour > 23 || minute > 59 || second > 59) {
    return std::nullopt;
  }

  const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }

  std::size_t pos    = 19;
  int         millis = 0;
  if (Expect(text, pos, '.')) {
    ++pos;
    int         scale  = 100;
    std::size_t digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      // sub-millisecond digits are truncated
      if (scale > 0) {
        millis += (text[pos] - '0') * scale;
        scale /= 10;
      }
      ++pos;
      ++digits;
    }
    if (digits == 0) {
      return std::nullopt;
    }
  }

  int offset_minutes = 0;
  if (pos < text.size()) {
    if (text[pos] == 'Z' && pos + 1 == text.size()) {
      pos = text.size();
    } else if (text[pos] == '+' || text[pos] == '-') {
      int oh = 0, om = 0;
      if (!ReadDigits(text, pos + 1, 2, oh) || !Expect(text, pos + 3, ':') || !ReadDigits(text, pos + 4, 2, om) || pos + 6 != text.size()) {
        return std::nullopt;
      }
      offset_minutes = (oh * 60 + om) * (text[pos] == '-' ? -1 : 1);
      pos            = text.size();
    } else {
      return std::nullopt;
    }
  }

  const auto days  = std::chrono::sys_days{ymd};
  auto       local = std::chrono::duration_cast<std::chrono::milliseconds>(days.time_since_epoch()) + std::chrono::hours(hour) +
               std::chrono::minutes(minute) + std::chrono::seconds(second) + std::chrono::milliseconds(millis);
  local -= std::chrono::minutes(offset_minutes);
  return static_cast<std::int64_t>(local.count());
}

std::string FormatIso8601Millis(std::int64_t epoch_ms) {
  const std::chrono::sys_time<std::chrono::milliseconds> tp{std::chrono::milliseconds(epoch_ms)};
  const auto                                             days = std::chrono::floor<std::chrono::days>(tp);
  const std::chrono::year_month_day                      ymd{days};
  const std::chrono::hh_mm_ss                            hms{tp - days};

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()), static_cast<int>(hms.hours().count()), static_cast<int>(hms.minutes().count()),
                static_cast<int>(hms.seconds().count()), static_cast<int>(hms.subseconds().count()));
  return buffer;
}

} // namespace edgestore::util
