#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <mutex>
#include <string>

#include "types.hpp"

struct RecorderConfig {
  // Logging settings
  bool verbose_logging = false;
  std::string log_level = "info";
  int summary_interval = 60;  // seconds

  // CSV cycle log, disabled when empty
  std::string csv_output_path;
};

struct RecorderStats {
  uint64_t total_cycles = 0;
  uint64_t done_cycles = 0;
  uint64_t failed_cycles = 0;
  uint64_t busy_rejections = 0;
  double total_e2e_time = 0.0;

  std::chrono::steady_clock::time_point start_time;
  std::chrono::steady_clock::time_point last_summary;

  void reset() {
    total_cycles = 0;
    done_cycles = 0;
    failed_cycles = 0;
    busy_rejections = 0;
    total_e2e_time = 0.0;
    start_time = std::chrono::steady_clock::now();
    last_summary = start_time;
  }

  double getAvgE2ETime() const {
    return done_cycles > 0 ? total_e2e_time / static_cast<double>(done_cycles) : 0.0;
  }

  double getFailureRate() const {
    return total_cycles > 0
               ? static_cast<double>(failed_cycles) / static_cast<double>(total_cycles) * 100.0
               : 0.0;
  }
};

// Sets the global spdlog level from a name (debug, info, warn, error).
void applyLogLevel(const std::string& level);

class CycleRecorder {
public:
  explicit CycleRecorder(const RecorderConfig& config);
  ~CycleRecorder();

  void record(const CycleResult& result);
  void logSummary(bool force = false);
  void close();

  RecorderStats stats() const;

private:
  RecorderConfig config_;
  mutable std::mutex mu_;
  RecorderStats stats_;
  std::ofstream csv_file_;

  void initializeCSV();
  void writeCSVRow(const CycleResult& result);
  void logSummaryLocked(bool force);
};
