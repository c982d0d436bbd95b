#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "can_transport.hpp"
#include "motor.hpp"
#include "stats.hpp"

// Address -> motor registry for one bus. Motors handed out share stats() and
// stay usable after the manager is gone, as long as the bus lives.
class MotorManager {
public:
  explicit MotorManager(CanTransport& bus, SafetyLimits default_limits = {},
                        std::chrono::milliseconds send_timeout = std::chrono::milliseconds(1000));

  MotorManager(const MotorManager&) = delete;
  MotorManager& operator=(const MotorManager&) = delete;

  // Returns the existing motor for addr, or creates one.
  // throws std::out_of_range unless addr is 1..32
  std::shared_ptr<EncosMotor> add_motor(uint8_t addr);
  void remove_motor(uint8_t addr);
  std::shared_ptr<EncosMotor> get_motor(uint8_t addr) const;
  std::vector<uint8_t> addresses() const;
  size_t size() const;

  // Limits applied to motors created afterwards.
  void set_default_limits(const SafetyLimits& l);
  // Overrides the default for one address, including a motor already added.
  void set_limits_for(uint8_t addr, const SafetyLimits& l);

  // Broadcasts the discovery query and collects replies for `timeout`.
  std::vector<uint8_t> scan_addresses(std::chrono::milliseconds timeout = std::chrono::milliseconds(3000),
                                      const std::atomic<bool>* cancel = nullptr);

  // scan_addresses() and add_motor() for every address found.
  std::vector<uint8_t> discover_motors(std::chrono::milliseconds timeout = std::chrono::milliseconds(3000),
                                       const std::atomic<bool>* cancel = nullptr);

  // Broadcast re-addressing; throws std::out_of_range unless new_addr is 1..32
  bool reset_address(int new_addr);

  // Number of motors that accepted the stop command.
  size_t stop_all();
  std::map<uint8_t, std::optional<encos::Status>> get_all_status(
      encos::FeedbackKind kind = encos::FeedbackKind::PosVelTorque,
      std::chrono::milliseconds timeout = std::chrono::milliseconds(1000),
      const std::atomic<bool>* cancel = nullptr);

  Stats& stats() { return *stats_; }
  const Stats& stats() const { return *stats_; }

private:
  std::vector<std::shared_ptr<EncosMotor>> snapshot_() const;

  CanTransport& bus_;
  std::chrono::milliseconds send_timeout_;
  std::shared_ptr<Stats> stats_;

  mutable std::mutex mu_;
  SafetyLimits default_limits_;
  std::map<uint8_t, SafetyLimits> per_motor_limits_;
  std::map<uint8_t, std::shared_ptr<EncosMotor>> motors_;
};
