#include "inference_api.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include "inference_engine.hpp"

namespace {

void send(httplib::Response& res, const Reply& r) {
  res.status = r.status;
  res.set_content(r.body.dump(), "application/json");
}

// Browsers post data URLs ("data:image/jpeg;base64,...").
std::string strip_data_url(const std::string& s) {
  if (s.rfind("data:", 0) == 0) {
    auto comma = s.find(',');
    if (comma != std::string::npos) return s.substr(comma + 1);
  }
  return s;
}

}  // namespace

nlohmann::json counts_body(const ClassCounts& counts) {
  return {{"can_count", counts.can}, {"plastic_count", counts.plastic}};
}

nlohmann::json cycle_body(const CycleResult& r) {
  nlohmann::json j = r.ok() ? nlohmann::json{{"status", "success"}}
                            : error_body(*r.error, r.message);
  j["peripheral"] = r.peripheral_id;
  j["state"] = cycle_state_name(r.state);
  if (r.classification) {
    j["prediction"] = label_name(r.classification->label);
    j["confidence"] = round_confidence(r.classification->confidence);
  }
  j["can_count"] = r.counts.can;
  j["plastic_count"] = r.counts.plastic;
  j["timings_ms"] = {{"capture", r.timings.capture_ms},
                     {"classify", r.timings.classify_ms},
                     {"actuate", r.timings.actuate_ms},
                     {"total", r.timings.e2e_ms}};
  return j;
}

nlohmann::json classify_body(const ClassifyResult& r) {
  if (!r.ok()) return error_body(*r.error, r.message);
  nlohmann::json j = counts_body(r.counts);
  j["status"] = "success";
  j["prediction"] = label_name(r.classification->label);
  j["confidence"] = round_confidence(r.classification->confidence);
  return j;
}

Reply InferenceApi::status() const {
  return {200, {{"status", "online"}, {"message", "Inference server is ready"}}};
}

Reply InferenceApi::classify(const std::string& request_body) {
  nlohmann::json req = nlohmann::json::parse(request_body, nullptr, /*allow_exceptions=*/false);
  auto image = req.is_object() ? req.find("image") : req.end();
  if (!req.is_object() || image == req.end() || !image->is_string()) {
    return {400, error_body(ErrorKind::ProtocolError, "No image provided")};
  }

  std::vector<unsigned char> bytes;
  try {
    bytes = base64_decode(strip_data_url(image->get<std::string>()));
  } catch (const StageError& e) {
    return {http_status_for(e.kind()), error_body(e.kind(), e.what())};
  }

  ClassifyResult r = controller_.classify_image(bytes);
  return {r.ok() ? 200 : http_status_for(*r.error), classify_body(r)};
}

Reply InferenceApi::start_session() {
  SessionSnapshot s = controller_.start();
  nlohmann::json data = counts_body(s.counts);
  data["is_active"] = s.running();
  return {200,
          {{"status", "success"}, {"message", "Session started"}, {"session_id", s.id}, {"data", data}}};
}

Reply InferenceApi::stop_session() {
  SessionSnapshot s = controller_.stop();
  return {200,
          {{"status", "success"},
           {"message", "Session stopped"},
           {"session_id", s.id},
           {"final_scores", counts_body(s.counts)}}};
}

Reply InferenceApi::scores() const {
  SessionSnapshot s = controller_.snapshot();
  nlohmann::json j = counts_body(s.counts);
  j["is_active"] = s.running();
  return {200, j};
}

Reply InferenceApi::run_cycle() {
  CycleResult r = controller_.run_cycle(peripheral_id_);
  return {r.ok() ? 200 : http_status_for(*r.error), cycle_body(r)};
}

std::string InferenceApi::metrics_text() const {
  return metrics_.prometheus_text(metrics_.snapshot());
}

void InferenceApi::bind(httplib::Server& svr) {
  svr.Get("/api/status", [this](const httplib::Request&, httplib::Response& res) {
    send(res, status());
  });
  svr.Post("/api/classify", [this](const httplib::Request& req, httplib::Response& res) {
    send(res, classify(req.body));
  });
  svr.Post("/api/session/start", [this](const httplib::Request&, httplib::Response& res) {
    send(res, start_session());
  });
  svr.Post("/api/session/stop", [this](const httplib::Request&, httplib::Response& res) {
    send(res, stop_session());
  });
  svr.Get("/api/scores", [this](const httplib::Request&, httplib::Response& res) {
    send(res, scores());
  });
  svr.Post("/api/cycle", [this](const httplib::Request&, httplib::Response& res) {
    send(res, run_cycle());
  });
  svr.Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
    res.set_content(metrics_text(), "text/plain; version=0.0.4");
  });
}
