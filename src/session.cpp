#include "session.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

using namespace std::chrono;

namespace {

double ms_since(TimePoint t0) { return duration<double, std::milli>(Clock::now() - t0).count(); }

CycleState next_of(CycleState s) {
  switch (s) {
    case CycleState::Idle:
      return CycleState::Capturing;
    case CycleState::Capturing:
      return CycleState::Classifying;
    case CycleState::Classifying:
      return CycleState::Actuating;
    case CycleState::Actuating:
      return CycleState::Done;
    default:
      throw std::logic_error("no transition out of " + cycle_state_name(s));
  }
}

// Error kind a stage reports for a failure it did not classify itself.
ErrorKind stage_kind(CycleState s) {
  switch (s) {
    case CycleState::Capturing:
      return ErrorKind::CaptureUnavailable;
    case CycleState::Classifying:
      return ErrorKind::ClassificationError;
    case CycleState::Actuating:
      return ErrorKind::ActuationError;
    default:
      return ErrorKind::InvalidState;
  }
}

}  // namespace

// Session

SessionSnapshot Session::start() {
  std::unique_lock<std::shared_mutex> lk(mu_);
  generation_++;
  id_ = "session-" + std::to_string(generation_);
  status_ = SessionStatus::Running;
  counts_ = ClassCounts{};
  started_at_ = WallClock::now();
  return {id_, status_, counts_, started_at_};
}

SessionSnapshot Session::stop() {
  std::unique_lock<std::shared_mutex> lk(mu_);
  if (status_ == SessionStatus::Running) status_ = SessionStatus::Stopped;
  return {id_, status_, counts_, started_at_};
}

SessionSnapshot Session::snapshot() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return {id_, status_, counts_, started_at_};
}

bool Session::running() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return status_ == SessionStatus::Running;
}

ClassCounts Session::commit(const std::string& session_id, ItemClass label) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  if (status_ != SessionStatus::Running || id_ != session_id) {
    throw StageError(ErrorKind::InvalidState, "session ended while the cycle was in flight");
  }
  if (label == ItemClass::Can) {
    counts_.can++;
  } else {
    counts_.plastic++;
  }
  return counts_;
}

// Cycle

void Cycle::advance(CycleState next) {
  if (terminal() || next_of(state_) != next) {
    throw std::logic_error("illegal cycle transition " + cycle_state_name(state_) + " -> " +
                           cycle_state_name(next));
  }
  spdlog::debug("[{}] {} -> {}", peripheral_id_, cycle_state_name(state_), cycle_state_name(next));
  state_ = next;
  history_.push_back(next);
}

void Cycle::fail(ErrorKind kind) {
  if (terminal()) {
    throw std::logic_error("cycle already finished in " + cycle_state_name(state_));
  }
  spdlog::debug("[{}] {} -> FAILED({})", peripheral_id_, cycle_state_name(state_),
                error_kind_name(kind));
  failure_ = kind;
  state_ = CycleState::Failed;
  history_.push_back(CycleState::Failed);
}

// SessionController

SessionController::SessionController(std::unique_ptr<InferenceEngine> engine,
                                     MetricsRegistry& metrics, CycleRecorder* recorder)
    : engine_(std::move(engine)), metrics_(metrics), recorder_(recorder) {
  if (!engine_) {
    throw std::runtime_error("SessionController needs an inference engine");
  }
}

void SessionController::register_peripheral(const std::string& id,
                                            std::unique_ptr<CaptureSource> capture,
                                            std::unique_ptr<ActuatorController> actuator) {
  if (!capture || !actuator) {
    throw std::runtime_error("peripheral '" + id + "' needs a capture source and an actuator");
  }
  auto slot = std::make_unique<PeripheralSlot>();
  slot->capture = std::move(capture);
  slot->actuator = std::move(actuator);

  std::lock_guard<std::mutex> g(slots_mu_);
  if (!slots_.emplace(id, std::move(slot)).second) {
    throw std::runtime_error("peripheral '" + id + "' registered twice");
  }
  spdlog::info("Registered peripheral '{}'", id);
}

std::vector<std::string> SessionController::peripherals() const {
  std::lock_guard<std::mutex> g(slots_mu_);
  std::vector<std::string> ids;
  for (const auto& kv : slots_) ids.push_back(kv.first);
  return ids;
}

SessionController::PeripheralSlot* SessionController::find_slot(const std::string& id) const {
  std::lock_guard<std::mutex> g(slots_mu_);
  auto it = slots_.find(id);
  return it == slots_.end() ? nullptr : it->second.get();
}

SessionSnapshot SessionController::start() {
  SessionSnapshot s = session_.start();
  spdlog::info("Session {} started", s.id);
  return s;
}

SessionSnapshot SessionController::stop() {
  SessionSnapshot s = session_.stop();
  spdlog::info("Session {} stopped: can={} plastic={}", s.id, s.counts.can, s.counts.plastic);
  std::lock_guard<std::mutex> g(slots_mu_);
  for (auto& kv : slots_) {
    // A cycle in flight keeps its camera; it is reopened on the next capture anyway.
    std::unique_lock<std::mutex> lk(kv.second->cycle_mu, std::try_to_lock);
    if (lk.owns_lock()) kv.second->capture->release();
  }
  return s;
}

CycleResult SessionController::finish(Cycle& cycle, CycleResult& result, TimePoint t0) {
  result.state = cycle.state();
  result.error = cycle.failure();
  result.timings.e2e_ms = ms_since(t0);
  result.finished_at = WallClock::now();

  if (result.ok()) {
    metrics_.record_done(result.timings);
    spdlog::info("[{}] {} ({:.2f}%) -> can={} plastic={} in {:.0f}ms", result.peripheral_id,
                 label_name(result.classification->label),
                 round_confidence(result.classification->confidence), result.counts.can,
                 result.counts.plastic, result.timings.e2e_ms);
  } else {
    result.counts = session_.snapshot().counts;
    metrics_.record_failure(*result.error);
    spdlog::warn("[{}] cycle failed with {}: {}", result.peripheral_id,
                 error_kind_name(*result.error), result.message);
  }

  if (recorder_) recorder_->record(result);
  return result;
}

CycleResult SessionController::run_cycle(const std::string& peripheral_id) {
  const TimePoint t0 = Clock::now();
  Cycle cycle(peripheral_id);
  CycleResult result;
  result.peripheral_id = peripheral_id;

  const SessionSnapshot session = session_.snapshot();
  if (!session.running()) {
    cycle.fail(ErrorKind::InvalidState);
    result.message = "Session not active. Please start first.";
    return finish(cycle, result, t0);
  }

  PeripheralSlot* slot = find_slot(peripheral_id);
  if (!slot) {
    cycle.fail(ErrorKind::InvalidState);
    result.message = "unknown peripheral '" + peripheral_id + "'";
    return finish(cycle, result, t0);
  }

  std::unique_lock<std::mutex> in_flight(slot->cycle_mu, std::try_to_lock);
  if (!in_flight.owns_lock()) {
    cycle.fail(ErrorKind::Busy);
    result.message = "a cycle is already in flight on '" + peripheral_id + "'";
    return finish(cycle, result, t0);
  }

  try {
    cycle.advance(CycleState::Capturing);
    TimePoint ts = Clock::now();
    CaptureResult captured = slot->capture->capture();
    result.timings.capture_ms = ms_since(ts);

    cycle.advance(CycleState::Classifying);
    ts = Clock::now();
    ClassificationResult cls = ::classify_image(*engine_, captured.image);
    result.timings.classify_ms = ms_since(ts);
    result.classification = cls;

    cycle.advance(CycleState::Actuating);
    ts = Clock::now();
    result.actuation = slot->actuator->activate(cls.label);
    result.timings.actuate_ms = ms_since(ts);

    result.counts = session_.commit(session.id, cls.label);
    cycle.advance(CycleState::Done);
  } catch (const StageError& e) {
    cycle.fail(e.kind());
    result.message = e.what();
  } catch (const std::exception& e) {
    cycle.fail(stage_kind(cycle.state()));
    result.message = e.what();
  }

  return finish(cycle, result, t0);
}

ClassifyResult SessionController::classify_image(const std::vector<unsigned char>& image) {
  ClassifyResult result;
  const SessionSnapshot session = session_.snapshot();
  if (!session.running()) {
    result.error = ErrorKind::InvalidState;
    result.message = "Session not active. Please start first.";
    result.counts = session.counts;
    return result;
  }

  try {
    ClassificationResult cls = ::classify_image(*engine_, image);
    result.classification = cls;
    result.counts = session_.commit(session.id, cls.label);
    spdlog::info("Classified upload: {} ({:.2f}%)", label_name(cls.label),
                 round_confidence(cls.confidence));
  } catch (const StageError& e) {
    result.error = e.kind();
    result.message = e.what();
    result.counts = session_.snapshot().counts;
    spdlog::warn("Classification failed with {}: {}", error_kind_name(e.kind()), e.what());
  }
  return result;
}
