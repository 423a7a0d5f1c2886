#pragma once
#include <string>

#include "metrics.hpp"
#include "session.hpp"
#include "wire.hpp"

namespace httplib {
class Server;
}

nlohmann::json counts_body(const ClassCounts& counts);
nlohmann::json cycle_body(const CycleResult& r);
nlohmann::json classify_body(const ClassifyResult& r);

// HTTP surface of the inference node.
class InferenceApi {
public:
  InferenceApi(SessionController& controller, MetricsRegistry& metrics, std::string peripheral_id)
      : controller_(controller), metrics_(metrics), peripheral_id_(std::move(peripheral_id)) {}

  Reply status() const;
  Reply classify(const std::string& request_body);
  Reply start_session();
  Reply stop_session();
  Reply scores() const;
  Reply run_cycle();
  std::string metrics_text() const;

  void bind(httplib::Server& svr);

private:
  SessionController& controller_;
  MetricsRegistry& metrics_;
  std::string peripheral_id_;
};
