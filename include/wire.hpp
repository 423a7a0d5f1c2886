#pragma once
#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "types.hpp"

// Address and timeouts of the peripheral node. Configured, never discovered.
struct PeerConfig {
  std::string id{"pi"};
  std::string host{"127.0.0.1"};
  int port{5001};
  int connect_timeout_ms{2000};
  int request_timeout_ms{5000};
};

// Status and JSON body of an endpoint, independent of the HTTP server.
struct Reply {
  int status{200};
  nlohmann::json body;
};

// HTTP status used for "resource held by another request".
constexpr int kBusyStatus = 409;

std::string base64_encode(const std::vector<unsigned char>& data);
// Throws StageError(ProtocolError) on characters outside the base64 alphabet.
std::vector<unsigned char> base64_decode(const std::string& text);

// {"status":"error","message":...,"error":<kind>}
nlohmann::json error_body(ErrorKind kind, const std::string& message);
nlohmann::json busy_body();

// Maps an error status/body to the HTTP code a handler answers with.
int http_status_for(ErrorKind kind);

PeripheralStatus parse_peripheral_status(const nlohmann::json& body);

struct PeerResponse {
  int status{0};
  nlohmann::json body;
};

// One request per call, no retries. A peer that cannot be reached within the
// configured bounds raises TransportError; a body that is not a JSON object
// raises ProtocolError.
class PeerClient {
public:
  explicit PeerClient(PeerConfig cfg) : cfg_(std::move(cfg)) {}

  PeerResponse get(const std::string& path) const;
  PeerResponse post(const std::string& path, const nlohmann::json& body,
                    std::chrono::milliseconds extra_read_time = std::chrono::milliseconds{0}) const;

  const PeerConfig& config() const { return cfg_; }
  std::string base_url() const;

private:
  PeerConfig cfg_;
};

// Raises the error carried by a peer reply: 409/busy → Busy, an error body or
// 4xx/5xx → failure_kind, anything else that is not a 200 success → ProtocolError.
void raise_for_peer_error(const PeerResponse& r, ErrorKind failure_kind);

// Reads a required string field or raises ProtocolError.
std::string require_string(const nlohmann::json& body, const std::string& key);
