#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "types.hpp"
#include "wire.hpp"

struct ChannelConfig {
  int pin{-1};
  int duration_ms{0};
};

struct ActuatorConfig {
  std::string gpio_root{"/sys/class/gpio"};
  ChannelConfig can{17, 1000};
  ChannelConfig plastic{27, 2000};
};

// Channel and run time for a label. Depends on nothing but the configuration.
ActuationCommand command_for(const ActuatorConfig& cfg, ItemClass target);

// Digital output pins.
class DigitalOutput {
public:
  virtual ~DigitalOutput() = default;
  virtual void setup(int pin) = 0;
  virtual void write(int pin, bool high) = 0;
};

// Linux sysfs GPIO (export, direction, value). Failures raise ActuationError.
class SysfsGpioOutput : public DigitalOutput {
public:
  explicit SysfsGpioOutput(std::string root = "/sys/class/gpio") : root_(std::move(root)) {}

  void setup(int pin) override;
  void write(int pin, bool high) override;

private:
  std::string root_;
  std::string pin_dir(int pin) const;
};

class ActuatorController {
public:
  virtual ~ActuatorController() = default;

  // Blocks until the channel for `target` has run its configured time and is off.
  virtual ActuationCommand activate(ItemClass target) = 0;
  virtual void initialize() {}
  virtual bool ready() const = 0;
};

// Energises the channel on construction. release() drives it low and reports a
// failure; the destructor only covers paths that never reached release().
class ChannelGuard {
public:
  ChannelGuard(DigitalOutput& out, int pin);
  ~ChannelGuard();

  ChannelGuard(const ChannelGuard&) = delete;
  ChannelGuard& operator=(const ChannelGuard&) = delete;

  // Throws StageError(ActuationError) when the pin cannot be driven low.
  void release();

private:
  DigitalOutput& out_;
  int pin_;
  bool released_{false};
};

// Drives the motor pins of this node.
class LocalActuator : public ActuatorController {
public:
  using HoldFn = std::function<void(std::chrono::milliseconds)>;

  // `hold` waits while the channel is energised; defaults to sleep_for.
  LocalActuator(ActuatorConfig cfg, std::unique_ptr<DigitalOutput> out, HoldFn hold = {});
  ~LocalActuator() override;

  void initialize() override;
  bool ready() const override { return initialized_.load(); }
  ActuationCommand activate(ItemClass target) override;

  const ActuatorConfig& config() const { return cfg_; }

private:
  ActuatorConfig cfg_;
  std::unique_ptr<DigitalOutput> out_;
  HoldFn hold_;

  std::mutex init_mu_;
  std::atomic<bool> initialized_{false};
  // Held for the whole activation: one channel at a time.
  std::mutex active_mu_;
  // Pin left high by a failed release, -1 if none. Guarded by active_mu_.
  int stuck_pin_{-1};

  void all_off() noexcept;
};

// Motor channel of a peripheral reached over HTTP: one POST per activation.
class RemoteActuator : public ActuatorController {
public:
  RemoteActuator(PeerConfig peer, ActuatorConfig cfg) : client_(std::move(peer)), cfg_(std::move(cfg)) {}

  ActuationCommand activate(ItemClass target) override;
  bool ready() const override;

private:
  PeerClient client_;
  ActuatorConfig cfg_;
};
