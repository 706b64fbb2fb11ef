#include <imgpipe/core/records.hpp>
#include <cstdio>
#include <ctime>

namespace imgpipe::core {

std::string_view to_string(OutcomeStatus s) noexcept {
  switch (s) {
    case OutcomeStatus::Pending:
      return "pending";
    case OutcomeStatus::Success:
      return "success";
    case OutcomeStatus::Failed:
      return "failed";
  }
  return "unknown";
}

std::int64_t to_epoch_ms(TimePoint t) noexcept {
  return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

TimePoint from_epoch_ms(std::int64_t ms) noexcept {
  return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

std::string format_timestamp(TimePoint t) {
  const std::int64_t ms = to_epoch_ms(t);
  std::int64_t secs = ms / 1000;
  std::int64_t millis = ms % 1000;
  if (millis < 0) {
    millis += 1000;
    --secs;
  }
  const std::time_t tt = static_cast<std::time_t>(secs);
  std::tm tm{};
  gmtime_r(&tt, &tm);

  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
  char out[48];
  std::snprintf(out, sizeof(out), "%s.%03dZ", date, static_cast<int>(millis));
  return out;
}

}  // namespace imgpipe::core
