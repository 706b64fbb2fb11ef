#include <imgpipe/app/stats.hpp>
#include <spdlog/fmt/fmt.h>
#include <chrono>

namespace imgpipe::app {

ProcessingStats compute_stats(std::span<const core::ProcessingOutcome> outcomes) {
  ProcessingStats s;
  s.total = outcomes.size();

  std::size_t success = 0;
  std::size_t completed = 0;
  double seconds = 0.0;
  for (const auto& o : outcomes) {
    if (o.status == core::OutcomeStatus::Success) ++success;
    if (o.status == core::OutcomeStatus::Failed) ++s.failed;
    if (o.end_time) {
      ++completed;
      seconds += std::chrono::duration<double>(*o.end_time - o.start_time).count();
    }
  }

  const double rate = s.total == 0 ? 0.0 : 100.0 * static_cast<double>(success) / static_cast<double>(s.total);
  s.success_rate = fmt::format("{:.2f}%", rate);
  s.average_processing_seconds = completed == 0 ? 0.0 : seconds / static_cast<double>(completed);
  return s;
}

ProcessingStats compute_stats(ledger::Ledger& ledger) {
  const auto outcomes = ledger.list_outcomes();
  return compute_stats(outcomes);
}

}  // namespace imgpipe::app
