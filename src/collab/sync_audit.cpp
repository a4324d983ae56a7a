#include "scenecast/collab/sync_audit.hpp"

#include <algorithm>
#include <cstdio>
#include <iterator>
#include <numeric>

namespace scenecast::collab {

namespace {

double mean(std::vector<double>::const_iterator begin, std::vector<double>::const_iterator end) {
  const auto count = std::distance(begin, end);
  if (count <= 0) {
    return 0.0;
  }
  return std::accumulate(begin, end, 0.0) / static_cast<double>(count);
}

std::string format(const char *pattern, double a, double b = 0.0, double c = 0.0) {
  char buffer[160];
  std::snprintf(buffer, sizeof(buffer), pattern, a, b, c);
  return buffer;
}

} // namespace

std::optional<std::string> first_quoted(const std::string &text) {
  const auto open = text.find('"');
  if (open == std::string::npos) {
    return std::nullopt;
  }
  const auto close = text.find('"', open + 1);
  if (close == std::string::npos || close == open + 1) {
    return std::nullopt;
  }
  return text.substr(open + 1, close - open - 1);
}

SyncReport audit_sync(const std::vector<session::StepRecord> &steps, const std::string &adder,
                      const std::string &viewer) {
  SyncReport report;
  std::vector<double> deltas;
  for (const auto &add : steps) {
    if (add.tag != adder || add.caption.find(ADD_MARKER) == std::string::npos) {
      continue;
    }
    const auto item = first_quoted(add.caption);
    if (!item.has_value()) {
      continue;
    }
    const std::string needle = "\"" + *item + "\"";
    const auto seen = std::find_if(steps.begin(), steps.end(), [&](const session::StepRecord &s) {
      return s.tag == viewer && s.caption.find(SEE_MARKER) != std::string::npos &&
             s.caption.find(needle) != std::string::npos;
    });
    if (seen == steps.end()) {
      continue;
    }
    SyncMeasurement measurement;
    measurement.item = *item;
    measurement.added_sec = static_cast<double>(add.end_ms) / 1000.0;
    measurement.seen_sec = static_cast<double>(seen->end_ms) / 1000.0;
    measurement.delta_sec = measurement.seen_sec - measurement.added_sec;
    deltas.push_back(measurement.delta_sec);
    report.measurements.push_back(std::move(measurement));
  }

  if (deltas.empty()) {
    return report;
  }
  SyncSummary summary;
  summary.count = deltas.size();
  summary.min_sec = *std::min_element(deltas.begin(), deltas.end());
  summary.max_sec = *std::max_element(deltas.begin(), deltas.end());
  summary.avg_sec = mean(deltas.begin(), deltas.end());
  summary.negatives = static_cast<std::size_t>(
      std::count_if(deltas.begin(), deltas.end(), [](double d) { return d <= 0.0; }));
  const auto window = static_cast<std::ptrdiff_t>(std::min(TREND_WINDOW, deltas.size()));
  summary.head_avg_sec = mean(deltas.begin(), deltas.begin() + window);
  summary.tail_avg_sec = mean(deltas.end() - window, deltas.end());
  report.summary = summary;
  return report;
}

std::vector<std::string> format_sync_report(const SyncReport &report, const std::string &adder_name,
                                            const std::string &viewer_name) {
  std::vector<std::string> lines;
  for (const auto &m : report.measurements) {
    lines.push_back("\"" + m.item + "\": " + adder_name + " added @ " +
                    format("%.1fs", m.added_sec) + ", " + viewer_name + " saw @ " +
                    format("%.1fs", m.seen_sec) + "  (" + format("%+.1fs", m.delta_sec) + ") " +
                    (m.ok() ? "OK" : "FAIL"));
  }
  if (report.summary.has_value()) {
    const auto &s = *report.summary;
    std::string line = "Sync summary: n=" + std::to_string(s.count) + ", " +
                       format("min=%.2fs, avg=%.2fs, max=%.2fs", s.min_sec, s.avg_sec, s.max_sec);
    if (s.negatives > 0) {
      line += ", negatives=" + std::to_string(s.negatives) + " (FAIL)";
    }
    lines.push_back(line);
    lines.push_back(format("Sync drift (last5 - first5): %+.2fs (first5=%.2fs, last5=%.2fs)",
                           s.trend_sec(), s.head_avg_sec, s.tail_avg_sec));
  }
  return lines;
}

} // namespace scenecast::collab
