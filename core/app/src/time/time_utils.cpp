#include "condor/time/time_utils.hpp"

#include <cstdio>

namespace condor {

namespace {

// Howard Hinnant's days_from_civil: proleptic Gregorian date -> days since
// 1970-01-01.
std::int64_t daysFromCivil(int y, int m, int d) {
  y -= m <= 2 ? 1 : 0;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy =
      (153 * static_cast<unsigned>(m + (m > 2 ? -3 : 9)) + 2) / 5 +
      static_cast<unsigned>(d) - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return static_cast<std::int64_t>(era) * 146097 +
         static_cast<std::int64_t>(doe) - 719468;
}

void civilFromDays(std::int64_t z, int& y, int& m, int& d) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  y = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 +
                       (m <= 2 ? 1 : 0));
}

}  // namespace

std::int64_t istToEpochMs(int year, int month, int day, int hour,
                          int minute) {
  std::int64_t local = daysFromCivil(year, month, day) * kMsPerDay +
                       (static_cast<std::int64_t>(hour) * 60 + minute) *
                           kMsPerMinute;
  return local - kIstOffsetMs;
}

std::string formatIst(std::int64_t epoch_ms) {
  int y = 0;
  int m = 0;
  int d = 0;
  civilFromDays(istDayIndex(epoch_ms), y, m, d);

  std::int64_t local = epoch_ms + kIstOffsetMs;
  std::int64_t within = local % kMsPerDay;
  if (within < 0) {
    within += kMsPerDay;
  }
  const int seconds = static_cast<int>(within / 1000);

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d IST", y, m,
                d, seconds / 3600, (seconds / 60) % 60, seconds % 60);
  return buf;
}

}  // namespace condor
