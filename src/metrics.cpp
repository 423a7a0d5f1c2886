#include "metrics.hpp"
#include <sstream>

void MetricsRegistry::record_done(const StageTimings& t) {
  capture_.add(t.capture_ms);
  classify_.add(t.classify_ms);
  actuate_.add(t.actuate_ms);
  e2e_.add(t.e2e_ms);
  cycles_total_.fetch_add(1, std::memory_order_relaxed);
  cycles_done_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::record_failure(ErrorKind kind) {
  cycles_total_.fetch_add(1, std::memory_order_relaxed);
  failures_[static_cast<size_t>(kind)].fetch_add(1, std::memory_order_relaxed);
}

StatSnapshot MetricsRegistry::snapshot() const {
  StatSnapshot s{};
  s.capture_p50 = capture_.perc(50);   s.capture_p95 = capture_.perc(95);
  s.classify_p50 = classify_.perc(50); s.classify_p95 = classify_.perc(95);
  s.actuate_p50 = actuate_.perc(50);   s.actuate_p95 = actuate_.perc(95);
  s.e2e_p50 = e2e_.perc(50);  s.e2e_p95 = e2e_.perc(95);  s.e2e_p99 = e2e_.perc(99);
  s.cycles_total = cycles_total_.load();
  s.cycles_done = cycles_done_.load();
  s.failure_rate = s.cycles_total
                       ? static_cast<double>(s.cycles_total - s.cycles_done) /
                             static_cast<double>(s.cycles_total)
                       : 0.0;
  return s;
}

std::string MetricsRegistry::prometheus_text(const StatSnapshot& s) const {
  std::ostringstream os;
  os << "cycle_e2e_ms{quantile=\"0.5\"} "  << s.e2e_p50 << "\n";
  os << "cycle_e2e_ms{quantile=\"0.95\"} " << s.e2e_p95 << "\n";
  os << "cycle_e2e_ms{quantile=\"0.99\"} " << s.e2e_p99 << "\n";
  os << "cycle_stage_ms{stage=\"capture\",quantile=\"0.95\"} "  << s.capture_p95 << "\n";
  os << "cycle_stage_ms{stage=\"classify\",quantile=\"0.95\"} " << s.classify_p95 << "\n";
  os << "cycle_stage_ms{stage=\"actuate\",quantile=\"0.95\"} "  << s.actuate_p95 << "\n";

  os << "cycles_total " << s.cycles_total << "\n";
  os << "cycles_done_total " << s.cycles_done << "\n";
  for (size_t i = 0; i < kErrorKindCount; ++i) {
    os << "cycle_failures_total{kind=\"" << error_kind_name(static_cast<ErrorKind>(i)) << "\"} "
       << failures_[i].load() << "\n";
  }

  os << "cycle_failure_rate " << s.failure_rate << "\n";
  return os.str();
}
