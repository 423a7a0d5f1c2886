#include "actuator.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <thread>

namespace fs = std::filesystem;

ActuationCommand command_for(const ActuatorConfig& cfg, ItemClass target) {
  const ChannelConfig& ch = target == ItemClass::Can ? cfg.can : cfg.plastic;
  ActuationCommand cmd;
  cmd.target = target;
  cmd.channel = ch.pin;
  cmd.duration = std::chrono::milliseconds(ch.duration_ms);
  return cmd;
}

// SysfsGpioOutput

std::string SysfsGpioOutput::pin_dir(int pin) const {
  return (fs::path(root_) / ("gpio" + std::to_string(pin))).string();
}

void SysfsGpioOutput::setup(int pin) {
  const fs::path dir(pin_dir(pin));
  if (!fs::exists(dir)) {
    std::ofstream exp(fs::path(root_) / "export");
    exp << pin;
    exp.flush();
    if (!exp) {
      throw StageError(ErrorKind::ActuationError, "cannot export GPIO " + std::to_string(pin));
    }
    // udev needs a moment to create the pin directory
    for (int i = 0; i < 20 && !fs::exists(dir / "direction"); ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }

  std::ofstream direction(dir / "direction");
  direction << "out";
  direction.flush();
  if (!direction) {
    throw StageError(ErrorKind::ActuationError, "cannot set GPIO " + std::to_string(pin) + " as output");
  }
}

void SysfsGpioOutput::write(int pin, bool high) {
  std::ofstream value(fs::path(pin_dir(pin)) / "value");
  value << (high ? "1" : "0");
  value.flush();
  if (!value) {
    throw StageError(ErrorKind::ActuationError, "cannot write GPIO " + std::to_string(pin));
  }
}

// ChannelGuard

ChannelGuard::ChannelGuard(DigitalOutput& out, int pin) : out_(out), pin_(pin) {
  try {
    out_.write(pin_, true);
  } catch (...) {
    // The destructor will not run; make sure a half-applied write is undone.
    try {
      out_.write(pin_, false);
    } catch (const std::exception& e) {
      spdlog::critical("GPIO {} could not be driven low after a failed activation: {}", pin_, e.what());
    }
    throw;
  }
}

ChannelGuard::~ChannelGuard() {
  if (released_) return;
  try {
    out_.write(pin_, false);
  } catch (const std::exception& e) {
    spdlog::critical("GPIO {} could not be driven low: {}", pin_, e.what());
  }
}

void ChannelGuard::release() {
  released_ = true;
  try {
    out_.write(pin_, false);
  } catch (const std::exception& e) {
    spdlog::critical("GPIO {} could not be driven low: {}", pin_, e.what());
    throw StageError(ErrorKind::ActuationError,
                     "GPIO " + std::to_string(pin_) + " stuck high: " + e.what());
  }
}

// LocalActuator

LocalActuator::LocalActuator(ActuatorConfig cfg, std::unique_ptr<DigitalOutput> out, HoldFn hold)
    : cfg_(std::move(cfg)), out_(std::move(out)), hold_(std::move(hold)) {
  if (!out_) {
    throw std::runtime_error("LocalActuator needs a digital output driver");
  }
  if (cfg_.can.pin == cfg_.plastic.pin) {
    throw std::runtime_error("can and plastic channels must use different pins");
  }
  if (!hold_) {
    hold_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

LocalActuator::~LocalActuator() {
  if (initialized_) all_off();
}

void LocalActuator::initialize() {
  std::lock_guard<std::mutex> g(init_mu_);
  if (initialized_) return;
  out_->setup(cfg_.can.pin);
  out_->setup(cfg_.plastic.pin);
  out_->write(cfg_.can.pin, false);
  out_->write(cfg_.plastic.pin, false);
  initialized_ = true;
  spdlog::info("GPIO initialized (can=pin{}, plastic=pin{})", cfg_.can.pin, cfg_.plastic.pin);
}

void LocalActuator::all_off() noexcept {
  for (int pin : {cfg_.can.pin, cfg_.plastic.pin}) {
    try {
      out_->write(pin, false);
    } catch (const std::exception& e) {
      spdlog::critical("GPIO {} could not be driven low: {}", pin, e.what());
    }
  }
}

ActuationCommand LocalActuator::activate(ItemClass target) {
  std::unique_lock<std::mutex> lk(active_mu_, std::try_to_lock);
  if (!lk.owns_lock()) {
    throw StageError(ErrorKind::Busy, "another channel is active");
  }

  if (stuck_pin_ >= 0) {
    // No other channel may be energised until the stuck one is confirmed low.
    try {
      out_->write(stuck_pin_, false);
    } catch (const std::exception& e) {
      throw StageError(ErrorKind::ActuationError,
                       "GPIO " + std::to_string(stuck_pin_) + " still stuck high: " + e.what());
    }
    spdlog::warn("GPIO {} driven low again after a failed release", stuck_pin_);
    stuck_pin_ = -1;
  }

  initialize();
  const ActuationCommand cmd = command_for(cfg_, target);
  if (cmd.channel < 0) {
    throw StageError(ErrorKind::ActuationError, "no channel configured for " + wire_name(target));
  }

  spdlog::info("Activating {} motor (pin {}) for {}ms", wire_name(target), cmd.channel,
               cmd.duration.count());

  std::string fault;
  std::string release_error;
  {
    ChannelGuard guard(*out_, cmd.channel);
    const auto deadline = Clock::now() + cmd.duration;
    try {
      hold_(cmd.duration);
    } catch (const std::exception& e) {
      fault = e.what();
    }
    // Run time is fixed: a fault or an early wake-up does not shorten it.
    const auto now = Clock::now();
    if (now < deadline) std::this_thread::sleep_for(deadline - now);

    try {
      guard.release();
    } catch (const StageError& e) {
      release_error = e.what();
    }
  }

  // A channel that is still energised outranks any fault seen during the hold.
  if (!release_error.empty()) {
    stuck_pin_ = cmd.channel;
    throw StageError(ErrorKind::ActuationError, release_error);
  }
  if (!fault.empty()) {
    spdlog::error("Fault during {} activation: {}", wire_name(target), fault);
    throw StageError(ErrorKind::ActuationError, "fault during activation: " + fault);
  }
  return cmd;
}

// RemoteActuator

ActuationCommand RemoteActuator::activate(ItemClass target) {
  const ActuationCommand cmd = command_for(cfg_, target);
  nlohmann::json body{{"prediction", wire_name(target)}};

  // The reply only arrives after the motor has run.
  PeerResponse r = client_.post("/api/motor", body, cmd.duration);
  raise_for_peer_error(r, ErrorKind::ActuationError);

  auto echoed = parse_item_class(require_string(r.body, "prediction"));
  if (!echoed || *echoed != target) {
    throw StageError(ErrorKind::ProtocolError, "motor reply does not echo the requested class");
  }
  spdlog::debug("Remote {} motor on {} ran for {}ms", wire_name(target), client_.config().id,
                cmd.duration.count());
  return cmd;
}

bool RemoteActuator::ready() const {
  try {
    PeerResponse r = client_.get("/api/status");
    raise_for_peer_error(r, ErrorKind::ActuationError);
    return parse_peripheral_status(r.body).actuator_ready;
  } catch (const StageError& e) {
    spdlog::warn("Peripheral {} status check failed: {}", client_.config().id, e.what());
    return false;
  }
}
