#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "can_transport.hpp"
#include "encos_protocol.hpp"
#include "stats.hpp"

struct SafetyLimits {
  double max_position_deg = 360.0;
  double max_velocity_rpm = 1000.0;
  double max_current_a    = 10.0;
  double max_torque_nm    = 5.0;
};

struct MotorInfo {
  uint8_t address = 0;
  SafetyLimits limits;
  std::optional<encos::Status> last_status;
  bool heartbeat_alive = true;
  std::optional<int64_t> ms_since_command;
};

using StatusCallback = std::function<void(const encos::Status&)>;
using ErrorCallback  = std::function<void(encos::ErrorKind)>;

// One motor on the bus. Registers itself for inbound frames on construction.
class EncosMotor {
public:
  static constexpr double kForceDefaultKp = 50.0;
  static constexpr double kForceDefaultKd = 5.0;

  // throws std::out_of_range unless address is 1..32
  // Must not outlive the bus. stats may be shared with other motors.
  EncosMotor(CanTransport& bus, uint8_t address, SafetyLimits limits = {},
             std::shared_ptr<Stats> stats = nullptr,
             std::chrono::milliseconds send_timeout = std::chrono::milliseconds(1000));
  ~EncosMotor();

  EncosMotor(const EncosMotor&) = delete;
  EncosMotor& operator=(const EncosMotor&) = delete;

  uint8_t address() const { return address_; }

  SafetyLimits limits() const;
  void set_limits(const SafetyLimits& l);

  // --- commands: false if rejected by a safety limit or the send failed ---
  bool set_zero_point();
  bool set_position(double position_deg, double speed_limit_rpm = 100.0,
                    double current_limit_a = 5.0, encos::MotorMode mode = encos::MotorMode::Servo);
  bool set_force_position(double position_deg, double kp, double kd,
                          double velocity_rad_s = 0.0, double torque_nm = 0.0);
  bool set_velocity(double velocity_rpm, double current_limit_a = 5.0);
  bool stop();

  // Sends a status request and waits for the next decodable frame from this
  // address. nullopt on send failure, timeout or cancellation.
  std::optional<encos::Status> get_status(
      encos::FeedbackKind kind = encos::FeedbackKind::PosVelTorque,
      std::chrono::milliseconds timeout = std::chrono::milliseconds(1000),
      const std::atomic<bool>* cancel = nullptr);

  // --- rx hook (transport receive thread) ---
  void on_frame(const CanFrame& f);

  std::optional<encos::Status> last_status() const;

  // true before the first command, and for 500 ms after each one
  bool is_heartbeat_alive() const;
  // true once 500 ms have passed since the last configuration command
  bool config_pacing_ok() const;

  MotorInfo info() const;

  // Observers run on the transport receive thread and must not block. They may
  // call back into the motor or its manager, including removing this motor.
  void add_status_callback(const std::string& name, StatusCallback cb);
  void remove_status_callback(const std::string& name);
  void add_error_callback(const std::string& name, ErrorCallback cb);
  void remove_error_callback(const std::string& name);

private:
  bool send_command_(const CanFrame& f, const char* what);
  bool check_position_(double deg) const;
  bool check_velocity_(double rpm) const;
  bool check_current_(double a) const;
  bool check_torque_(double nm) const;

  CanTransport& bus_;
  const uint8_t address_;
  std::shared_ptr<Stats> stats_;
  std::chrono::milliseconds send_timeout_;
  int rx_handle_ = -1;

  mutable std::mutex mu_;
  SafetyLimits limits_;
  std::optional<encos::Status> status_;
  uint64_t status_seq_ = 0;
  std::condition_variable cv_status_;
  std::optional<std::chrono::steady_clock::time_point> last_command_tp_;
  std::optional<std::chrono::steady_clock::time_point> last_config_tp_;

  // observers: copied under obs_mu_, then invoked unlocked
  std::mutex obs_mu_;
  std::map<std::string, StatusCallback> status_cbs_;
  std::map<std::string, ErrorCallback> error_cbs_;
};
