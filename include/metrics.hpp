#pragma once
#include <algorithm>
#include <array>
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "types.hpp"

class RollingHist {
public:
  explicit RollingHist(size_t cap = 256) : cap_(cap) {}
  void add(double x) {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.size() == cap_) vals_.pop_front();
    vals_.push_back(x);
  }
  // Percentile p in [0,100]
  double perc(double p) const {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.empty()) return 0.0;
    std::vector<double> v(vals_.begin(), vals_.end());
    std::sort(v.begin(), v.end());
    double rank = (p / 100.0) * static_cast<double>(v.size() - 1);
    size_t lo = static_cast<size_t>(rank);
    size_t hi = std::min(v.size() - 1, lo + 1);
    double frac = rank - static_cast<double>(lo);
    return v[lo] + (v[hi] - v[lo]) * frac;
  }
  size_t size() const {
    std::lock_guard<std::mutex> g(mu_);
    return vals_.size();
  }

private:
  size_t cap_;
  mutable std::mutex mu_;
  std::deque<double> vals_;
};

struct StatSnapshot {
  double capture_p50{0}, capture_p95{0};
  double classify_p50{0}, classify_p95{0};
  double actuate_p50{0}, actuate_p95{0};
  double e2e_p50{0}, e2e_p95{0}, e2e_p99{0};
  uint64_t cycles_total{0};
  uint64_t cycles_done{0};
  double failure_rate{0};
};

constexpr size_t kErrorKindCount = 7;

class MetricsRegistry {
public:
  // Stage timings of a cycle that reached DONE.
  void record_done(const StageTimings& t);
  void record_failure(ErrorKind kind);

  uint64_t cycles_total() const { return cycles_total_.load(std::memory_order_relaxed); }
  uint64_t cycles_done() const { return cycles_done_.load(std::memory_order_relaxed); }
  uint64_t failures(ErrorKind kind) const {
    return failures_[static_cast<size_t>(kind)].load(std::memory_order_relaxed);
  }

  StatSnapshot snapshot() const;
  std::string prometheus_text(const StatSnapshot& s) const;

private:
  RollingHist capture_, classify_, actuate_, e2e_;
  std::atomic<uint64_t> cycles_total_{0};
  std::atomic<uint64_t> cycles_done_{0};
  std::array<std::atomic<uint64_t>, kErrorKindCount> failures_{};
};
