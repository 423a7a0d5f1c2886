#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "actuator.hpp"
#include "capture_source.hpp"
#include "cycle_recorder.hpp"
#include "inference_engine.hpp"
#include "metrics.hpp"
#include "types.hpp"

struct SessionConfig {
  // "local" or "remote", chosen once at startup
  std::string capture_mode{"remote"};
  std::string actuator_mode{"remote"};
  bool auto_start{true};
};

struct SessionSnapshot {
  std::string id;
  SessionStatus status{SessionStatus::Idle};
  ClassCounts counts;
  WallClock::time_point started_at{};

  bool running() const { return status == SessionStatus::Running; }
};

// Counters of one sorting session. Readers never see a partially applied update.
class Session {
public:
  SessionSnapshot start();
  SessionSnapshot stop();
  SessionSnapshot snapshot() const;
  bool running() const;

  // Adds one item to `label` if `session_id` is still the running session.
  // Throws StageError(InvalidState) otherwise.
  ClassCounts commit(const std::string& session_id, ItemClass label);

private:
  mutable std::shared_mutex mu_;
  std::string id_;
  SessionStatus status_{SessionStatus::Idle};
  ClassCounts counts_;
  WallClock::time_point started_at_{};
  uint64_t generation_{0};
};

// One pass of the cycle state machine. Transitions only move forward.
class Cycle {
public:
  explicit Cycle(std::string peripheral_id) : peripheral_id_(std::move(peripheral_id)) {}

  CycleState state() const { return state_; }
  std::optional<ErrorKind> failure() const { return failure_; }
  bool terminal() const { return state_ == CycleState::Done || state_ == CycleState::Failed; }
  const std::vector<CycleState>& history() const { return history_; }

  // Throws std::logic_error unless `next` directly follows the current state.
  void advance(CycleState next);
  // Throws std::logic_error from a terminal state.
  void fail(ErrorKind kind);

private:
  std::string peripheral_id_;
  CycleState state_{CycleState::Idle};
  std::optional<ErrorKind> failure_;
  std::vector<CycleState> history_{CycleState::Idle};
};

class SessionController {
public:
  SessionController(std::unique_ptr<InferenceEngine> engine, MetricsRegistry& metrics,
                    CycleRecorder* recorder = nullptr);

  void register_peripheral(const std::string& id, std::unique_ptr<CaptureSource> capture,
                           std::unique_ptr<ActuatorController> actuator);
  std::vector<std::string> peripherals() const;

  SessionSnapshot start();
  SessionSnapshot stop();
  SessionSnapshot snapshot() const { return session_.snapshot(); }

  // Never throws for stage failures; they come back tagged in the result.
  CycleResult run_cycle(const std::string& peripheral_id);

  // Classifies an uploaded image and counts it. No capture, no actuation.
  ClassifyResult classify_image(const std::vector<unsigned char>& image);

private:
  struct PeripheralSlot {
    std::unique_ptr<CaptureSource> capture;
    std::unique_ptr<ActuatorController> actuator;
    // Held for the whole cycle; try-locked so a second request fails fast.
    std::mutex cycle_mu;
  };

  std::unique_ptr<InferenceEngine> engine_;
  MetricsRegistry& metrics_;
  CycleRecorder* recorder_;
  Session session_;

  mutable std::mutex slots_mu_;
  std::map<std::string, std::unique_ptr<PeripheralSlot>> slots_;

  PeripheralSlot* find_slot(const std::string& id) const;
  CycleResult finish(Cycle& cycle, CycleResult& result, TimePoint t0);
};
