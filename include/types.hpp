#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;
using WallClock = std::chrono::system_clock;

// Can is the "below threshold" class, Plastic the "at or above threshold" class.
enum class ItemClass { Can, Plastic };

// "Can" / "Plastic"
std::string label_name(ItemClass c);
// "can" / "plastic"
std::string wire_name(ItemClass c);
// Case-insensitive, accepts either spelling above.
std::optional<ItemClass> parse_item_class(const std::string& s);

enum class ErrorKind {
  CaptureUnavailable,
  TransportError,
  ClassificationError,
  ActuationError,
  ProtocolError,
  Busy,
  InvalidState
};

std::string error_kind_name(ErrorKind k);

class StageError : public std::runtime_error {
public:
  StageError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}
  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

struct CaptureResult {
  std::vector<unsigned char> image;  // JPEG
  int width{0};
  int height{0};
  std::string peripheral_id;
  WallClock::time_point captured_at{};
};

struct ClassificationResult {
  ItemClass label{ItemClass::Can};
  double confidence{0.0};   // [50, 100]
  double probability{0.0};  // raw P(Plastic)
};

struct ActuationCommand {
  ItemClass target{ItemClass::Can};
  int channel{-1};
  std::chrono::milliseconds duration{0};
};

struct PeripheralStatus {
  bool camera_available{false};
  bool actuator_ready{false};
  WallClock::time_point last_seen{};
};

enum class SessionStatus { Idle, Running, Stopped };

std::string session_status_name(SessionStatus s);

enum class CycleState { Idle, Capturing, Classifying, Actuating, Done, Failed };

std::string cycle_state_name(CycleState s);

struct StageTimings {
  double capture_ms{0}, classify_ms{0}, actuate_ms{0}, e2e_ms{0};
};

struct ClassCounts {
  uint64_t can{0};
  uint64_t plastic{0};

  uint64_t total() const { return can + plastic; }
};

// Outcome of one capture→classify→actuate cycle. Failures are values, not exceptions.
struct CycleResult {
  std::string peripheral_id;
  CycleState state{CycleState::Idle};
  std::optional<ErrorKind> error;
  std::string message;
  std::optional<ClassificationResult> classification;
  std::optional<ActuationCommand> actuation;
  ClassCounts counts;  // counters after the cycle
  StageTimings timings;
  WallClock::time_point finished_at{};

  bool ok() const { return state == CycleState::Done; }
};

// Outcome of classifying an uploaded image (no capture, no actuation).
struct ClassifyResult {
  std::optional<ErrorKind> error;
  std::string message;
  std::optional<ClassificationResult> classification;
  ClassCounts counts;

  bool ok() const { return !error.has_value(); }
};
