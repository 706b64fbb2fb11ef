#pragma once

#include <imgpipe/core/records.hpp>
#include <imgpipe/ledger/ledger.hpp>
#include <cstddef>
#include <span>
#include <string>

namespace imgpipe::app {

/// Aggregate over all processing outcomes.
struct ProcessingStats {
  std::size_t total{0};
  std::size_t failed{0};
  /// success / total as a percentage with two decimals, e.g. "50.00%". "0.00%" when empty.
  std::string success_rate{"0.00%"};
  /// Mean of (end - start) over outcomes with an end time; 0 when there are none.
  double average_processing_seconds{0.0};
};

[[nodiscard]] ProcessingStats compute_stats(std::span<const core::ProcessingOutcome> outcomes);

/// Reads every outcome from the ledger.
[[nodiscard]] ProcessingStats compute_stats(ledger::Ledger& ledger);

}  // namespace imgpipe::app
