#include "wire.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <array>

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decode_char(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+' || c == '-') return 62;
  if (c == '/' || c == '_') return 63;
  return -1;
}

nlohmann::json parse_body(const std::string& text, int status) {
  nlohmann::json j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) {
    throw StageError(ErrorKind::ProtocolError,
                     "peer returned a non-JSON body (HTTP " + std::to_string(status) + ")");
  }
  return j;
}

void apply_timeouts(httplib::Client& cli, const PeerConfig& cfg,
                    std::chrono::milliseconds extra_read_time) {
  cli.set_connection_timeout(std::chrono::milliseconds(cfg.connect_timeout_ms));
  cli.set_read_timeout(std::chrono::milliseconds(cfg.request_timeout_ms) + extra_read_time);
  cli.set_write_timeout(std::chrono::milliseconds(cfg.request_timeout_ms));
}

}  // namespace

std::string base64_encode(const std::vector<unsigned char>& data) {
  std::string out;
  out.reserve(((data.size() + 2) / 3) * 4);
  size_t i = 0;
  for (; i + 2 < data.size(); i += 3) {
    uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                 (static_cast<uint32_t>(data[i + 1]) << 8) | data[i + 2];
    out.push_back(kAlphabet[(n >> 18) & 0x3F]);
    out.push_back(kAlphabet[(n >> 12) & 0x3F]);
    out.push_back(kAlphabet[(n >> 6) & 0x3F]);
    out.push_back(kAlphabet[n & 0x3F]);
  }
  const size_t rest = data.size() - i;
  if (rest == 1) {
    uint32_t n = static_cast<uint32_t>(data[i]) << 16;
    out.push_back(kAlphabet[(n >> 18) & 0x3F]);
    out.push_back(kAlphabet[(n >> 12) & 0x3F]);
    out += "==";
  } else if (rest == 2) {
    uint32_t n = (static_cast<uint32_t>(data[i]) << 16) | (static_cast<uint32_t>(data[i + 1]) << 8);
    out.push_back(kAlphabet[(n >> 18) & 0x3F]);
    out.push_back(kAlphabet[(n >> 12) & 0x3F]);
    out.push_back(kAlphabet[(n >> 6) & 0x3F]);
    out.push_back('=');
  }
  return out;
}

std::vector<unsigned char> base64_decode(const std::string& text) {
  std::vector<unsigned char> out;
  out.reserve(text.size() / 4 * 3);
  uint32_t acc = 0;
  int bits = 0;
  for (char c : text) {
    if (c == '=') break;
    if (c == '\n' || c == '\r' || c == ' ') continue;
    int v = decode_char(c);
    if (v < 0) {
      throw StageError(ErrorKind::ProtocolError, "invalid base64 payload");
    }
    acc = (acc << 6) | static_cast<uint32_t>(v);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<unsigned char>((acc >> bits) & 0xFF));
    }
  }
  return out;
}

nlohmann::json error_body(ErrorKind kind, const std::string& message) {
  return {{"status", "error"}, {"message", message}, {"error", error_kind_name(kind)}};
}

nlohmann::json busy_body() {
  nlohmann::json j = error_body(ErrorKind::Busy, "busy");
  j["busy"] = true;
  return j;
}

int http_status_for(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Busy:
      return kBusyStatus;
    case ErrorKind::InvalidState:
    case ErrorKind::ProtocolError:
      return 400;
    case ErrorKind::TransportError:
      return 502;
    default:
      return 500;
  }
}

PeripheralStatus parse_peripheral_status(const nlohmann::json& body) {
  PeripheralStatus s;
  auto cam = body.find("camera_available");
  auto gpio = body.find("gpio_initialized");
  if (cam == body.end() || !cam->is_boolean() || gpio == body.end() || !gpio->is_boolean()) {
    throw StageError(ErrorKind::ProtocolError, "status reply lacks camera_available/gpio_initialized");
  }
  s.camera_available = cam->get<bool>();
  s.actuator_ready = gpio->get<bool>();
  s.last_seen = WallClock::now();
  return s;
}

std::string PeerClient::base_url() const {
  return "http://" + cfg_.host + ":" + std::to_string(cfg_.port);
}

PeerResponse PeerClient::get(const std::string& path) const {
  httplib::Client cli(cfg_.host, cfg_.port);
  apply_timeouts(cli, cfg_, std::chrono::milliseconds{0});

  auto res = cli.Get(path);
  if (!res) {
    throw StageError(ErrorKind::TransportError, "GET " + base_url() + path + " failed: " +
                                                    httplib::to_string(res.error()));
  }
  spdlog::debug("GET {}{} -> {}", base_url(), path, res->status);
  return {res->status, parse_body(res->body, res->status)};
}

PeerResponse PeerClient::post(const std::string& path, const nlohmann::json& body,
                              std::chrono::milliseconds extra_read_time) const {
  httplib::Client cli(cfg_.host, cfg_.port);
  apply_timeouts(cli, cfg_, extra_read_time);

  auto res = cli.Post(path, body.dump(), "application/json");
  if (!res) {
    throw StageError(ErrorKind::TransportError, "POST " + base_url() + path + " failed: " +
                                                    httplib::to_string(res.error()));
  }
  spdlog::debug("POST {}{} -> {}", base_url(), path, res->status);
  return {res->status, parse_body(res->body, res->status)};
}

void raise_for_peer_error(const PeerResponse& r, ErrorKind failure_kind) {
  const auto& b = r.body;
  std::string message;
  if (auto it = b.find("message"); it != b.end() && it->is_string()) message = it->get<std::string>();
  auto busy = b.find("busy");
  if (r.status == kBusyStatus || (busy != b.end() && busy->is_boolean() && busy->get<bool>())) {
    throw StageError(ErrorKind::Busy, message.empty() ? "peripheral busy" : message);
  }
  auto status = b.find("status");
  const bool error_status = status != b.end() && status->is_string() && *status == "error";
  if (error_status || r.status >= 400) {
    throw StageError(failure_kind, message.empty() ? "peer error (HTTP " + std::to_string(r.status) + ")"
                                                   : message);
  }
  if (r.status != 200) {
    throw StageError(ErrorKind::ProtocolError, "unexpected HTTP " + std::to_string(r.status));
  }
}

std::string require_string(const nlohmann::json& body, const std::string& key) {
  auto it = body.find(key);
  if (it == body.end() || !it->is_string()) {
    throw StageError(ErrorKind::ProtocolError, "reply lacks string field '" + key + "'");
  }
  return it->get<std::string>();
}
