#include "cycle_recorder.hpp"

#include <spdlog/fmt/fmt.h>

#include <filesystem>
#include <iomanip>

#include "inference_engine.hpp"

void applyLogLevel(const std::string& level) {
  if (level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (level == "error") {
    spdlog::set_level(spdlog::level::err);
  } else {
    spdlog::warn("Unknown log level '{}', keeping current level", level);
  }
}

CycleRecorder::CycleRecorder(const RecorderConfig& config) : config_(config) {
  applyLogLevel(config_.log_level);
  stats_.reset();

  if (!config_.csv_output_path.empty()) {
    initializeCSV();
  }
}

CycleRecorder::~CycleRecorder() { close(); }

void CycleRecorder::close() {
  std::lock_guard<std::mutex> g(mu_);
  if (csv_file_.is_open()) {
    csv_file_.close();
    spdlog::info("Cycle log completed: {}", config_.csv_output_path);
  }
}

void CycleRecorder::record(const CycleResult& result) {
  std::lock_guard<std::mutex> g(mu_);
  stats_.total_cycles++;
  if (result.ok()) {
    stats_.done_cycles++;
    stats_.total_e2e_time += result.timings.e2e_ms;
  } else {
    stats_.failed_cycles++;
    if (result.error == ErrorKind::Busy) stats_.busy_rejections++;
  }

  if (csv_file_.is_open()) {
    writeCSVRow(result);
  }

  if (config_.verbose_logging) {
    spdlog::info(
        "cycle peripheral={} state={} capture_ms={:.1f} classify_ms={:.1f} actuate_ms={:.1f} "
        "e2e_ms={:.1f} can={} plastic={}",
        result.peripheral_id, cycle_state_name(result.state), result.timings.capture_ms,
        result.timings.classify_ms, result.timings.actuate_ms, result.timings.e2e_ms,
        result.counts.can, result.counts.plastic);
  }

  logSummaryLocked(false);
}

void CycleRecorder::logSummary(bool force) {
  std::lock_guard<std::mutex> g(mu_);
  logSummaryLocked(force);
}

void CycleRecorder::logSummaryLocked(bool force) {
  auto now = std::chrono::steady_clock::now();
  auto duration = std::chrono::duration_cast<std::chrono::seconds>(now - stats_.last_summary);

  if (!force && duration.count() < config_.summary_interval) {
    return;
  }

  spdlog::info("=== CYCLE SUMMARY ===");
  spdlog::info("Cycles run: {} ({} done, {} failed)", stats_.total_cycles, stats_.done_cycles,
               stats_.failed_cycles);
  spdlog::info("Average cycle time: {:.1f}ms", stats_.getAvgE2ETime());
  spdlog::info("Failure rate: {:.2f}%", stats_.getFailureRate());
  if (stats_.busy_rejections > 0) {
    spdlog::info("Rejected as busy: {}", stats_.busy_rejections);
  }

  stats_.last_summary = now;
}

RecorderStats CycleRecorder::stats() const {
  std::lock_guard<std::mutex> g(mu_);
  return stats_;
}

void CycleRecorder::initializeCSV() {
  std::filesystem::path csv_path(config_.csv_output_path);
  std::filesystem::path directory = csv_path.parent_path();

  if (!directory.empty() && !std::filesystem::exists(directory)) {
    std::filesystem::create_directories(directory);
    spdlog::info("Created cycle log directory: {}", directory.string());
  }

  csv_file_.open(config_.csv_output_path, std::ios::out | std::ios::trunc);
  if (!csv_file_.is_open()) {
    spdlog::error("Failed to open cycle log for writing: {}", config_.csv_output_path);
    return;
  }

  csv_file_ << "finished_at_ms,peripheral,state,error,prediction,confidence,probability,"
            << "channel,duration_ms,capture_ms,classify_ms,actuate_ms,e2e_ms,"
            << "can_count,plastic_count\n";
  csv_file_.flush();

  spdlog::info("Cycle log initialized: {}", config_.csv_output_path);
}

void CycleRecorder::writeCSVRow(const CycleResult& result) {
  const auto finished_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                               result.finished_at.time_since_epoch())
                               .count();

  csv_file_ << finished_ms << "," << result.peripheral_id << ","
            << cycle_state_name(result.state) << ","
            << (result.error ? error_kind_name(*result.error) : "") << ",";

  if (result.classification) {
    csv_file_ << label_name(result.classification->label) << "," << std::fixed
              << std::setprecision(2) << round_confidence(result.classification->confidence)
              << "," << std::setprecision(4) << result.classification->probability << ",";
  } else {
    csv_file_ << ",,,";
  }

  if (result.actuation) {
    csv_file_ << result.actuation->channel << "," << result.actuation->duration.count() << ",";
  } else {
    csv_file_ << ",,";
  }

  csv_file_ << std::fixed << std::setprecision(3) << result.timings.capture_ms << ","
            << result.timings.classify_ms << "," << result.timings.actuate_ms << ","
            << result.timings.e2e_ms << "," << result.counts.can << "," << result.counts.plastic
            << "\n";
  csv_file_.flush();
}
