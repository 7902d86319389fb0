/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex
 *
 *          - TimingCollector static members and methods
 */

#include "cursor_fx/logging.hpp"

#include <map>

#include <fmt/color.h>
#include <fmt/core.h>

namespace cursor_fx {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  /// Stages repeat once per job, so aggregate by name (first-seen order)
  std::vector<std::string> order;
  std::map<std::string, std::pair<long, int>> totals;
  for (const auto &e : entries) {
    auto it = totals.find(e.name);
    if (it == totals.end()) {
      order.push_back(e.name);
      totals[e.name] = {e.microseconds, 1};
    } else {
      it->second.first += e.microseconds;
      it->second.second += 1;
    }
  }

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<24} {:>6} {:>20}\n", "Stage", "Runs", "Time (us) [sec]");
  fmt::print("{:-<24} {:-<6} {:-<20}\n", "", "", "");

  for (const auto &name : order) {
    const auto &t = totals[name];
    double seconds = t.first / 1000000.0;
    fmt::print("{:<24} {:>6} {:>10} [{:.2f}s]\n", name, t.second, t.first,
               seconds);
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

} // namespace cursor_fx
