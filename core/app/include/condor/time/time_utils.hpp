#pragma once

#include <cstdint>
#include <string>

namespace condor {

// -----------------------------------------------------------------------------
// Exchange-time helpers
// -----------------------------------------------------------------------------
// NSE and BSE trade on India Standard Time (UTC+05:30, no DST). Entry
// windows and the end-of-day square-off are configured in IST minutes of the
// day; these helpers convert epoch milliseconds without touching the host
// timezone.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMsPerMinute = 60LL * 1000LL;
constexpr std::int64_t kMsPerDay = 24LL * 60LL * kMsPerMinute;
constexpr std::int64_t kIstOffsetMs = (5LL * 60LL + 30LL) * kMsPerMinute;
constexpr double kMsPerYear = 365.0 * static_cast<double>(kMsPerDay);

// Days since 1970-01-01 in IST. Two instants share a trading day iff their
// istDayIndex() is equal.
inline std::int64_t istDayIndex(std::int64_t epoch_ms) {
  std::int64_t local = epoch_ms + kIstOffsetMs;
  std::int64_t day = local / kMsPerDay;
  if (local % kMsPerDay < 0) {
    --day;
  }
  return day;
}

// Minutes since IST midnight, 0..1439.
inline int istMinuteOfDay(std::int64_t epoch_ms) {
  std::int64_t local = epoch_ms + kIstOffsetMs;
  std::int64_t within = local % kMsPerDay;
  if (within < 0) {
    within += kMsPerDay;
  }
  return static_cast<int>(within / kMsPerMinute);
}

// Epoch ms for an IST civil date and time.
std::int64_t istToEpochMs(int year, int month, int day, int hour, int minute);

// "YYYY-MM-DD HH:MM:SS IST", for log lines.
std::string formatIst(std::int64_t epoch_ms);

}  // namespace condor
