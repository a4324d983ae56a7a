#pragma once

#include "scenecast/session/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace scenecast::collab {

inline constexpr const char *ADD_MARKER = "adds task:";
inline constexpr const char *SEE_MARKER = "sees";
inline constexpr std::size_t TREND_WINDOW = 5;

/// One item added by the first actor and later observed by the second.
struct SyncMeasurement {
  std::string item;
  double added_sec = 0.0;
  double seen_sec = 0.0;
  double delta_sec = 0.0;
  [[nodiscard]] bool ok() const { return delta_sec > 0.0; }
};

struct SyncSummary {
  std::size_t count = 0;
  double min_sec = 0.0;
  double avg_sec = 0.0;
  double max_sec = 0.0;
  std::size_t negatives = 0;
  // Means of the first and last TREND_WINDOW deltas.
  double head_avg_sec = 0.0;
  double tail_avg_sec = 0.0;
  [[nodiscard]] double trend_sec() const { return tail_avg_sec - head_avg_sec; }
};

struct SyncReport {
  std::vector<SyncMeasurement> measurements;
  std::optional<SyncSummary> summary;
};

/// Text between the first pair of double quotes.
[[nodiscard]] std::optional<std::string> first_quoted(const std::string &text);

/// Pairs `adder` steps captioned with ADD_MARKER against the first `viewer` step
/// with SEE_MARKER that quotes the same item. Deltas use step end times.
[[nodiscard]] SyncReport audit_sync(const std::vector<session::StepRecord> &steps,
                                    const std::string &adder, const std::string &viewer);

[[nodiscard]] std::vector<std::string> format_sync_report(const SyncReport &report,
                                                          const std::string &adder_name,
                                                          const std::string &viewer_name);

} // namespace scenecast::collab
