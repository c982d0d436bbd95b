#include "motor.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "codec.hpp"

using namespace encos;

namespace {

constexpr auto kHeartbeatWindow = std::chrono::milliseconds(kHeartbeatTimeoutMs);
constexpr auto kPacingWindow    = std::chrono::milliseconds(kCommandIntervalMs);
constexpr auto kWaitSlice       = std::chrono::milliseconds(10);

// NaN never passes
bool within(double v, double limit) { return std::abs(v) <= limit; }

} // namespace

EncosMotor::EncosMotor(CanTransport& bus, uint8_t address, SafetyLimits limits,
                       std::shared_ptr<Stats> stats, std::chrono::milliseconds send_timeout)
: bus_(bus), address_(address), stats_(std::move(stats)), send_timeout_(send_timeout), limits_(limits)
{
  if (!valid_motor_id(address_))
    throw std::out_of_range("motor address must be 1..32, got " + std::to_string(int(address_)));

  rx_handle_ = bus_.add_frame_callback([this](const CanFrame& f){ on_frame(f); });
}

EncosMotor::~EncosMotor() {
  if (rx_handle_ >= 0) bus_.remove_frame_callback(rx_handle_);
}

SafetyLimits EncosMotor::limits() const {
  std::lock_guard<std::mutex> lk(mu_);
  return limits_;
}

void EncosMotor::set_limits(const SafetyLimits& l) {
  std::lock_guard<std::mutex> lk(mu_);
  limits_ = l;
}

// ================= safety =================

bool EncosMotor::check_position_(double deg) const {
  const double lim = limits().max_position_deg;
  if (within(deg, lim)) return true;
  std::cerr << "[motor " << int(address_) << "] position " << deg
            << " deg outside +/-" << lim << " deg\n";
  return false;
}

bool EncosMotor::check_velocity_(double rpm) const {
  const double lim = limits().max_velocity_rpm;
  if (within(rpm, lim)) return true;
  std::cerr << "[motor " << int(address_) << "] velocity " << rpm
            << " RPM outside +/-" << lim << " RPM\n";
  return false;
}

// Only the upper bound is checked for current.
bool EncosMotor::check_current_(double a) const {
  const double lim = limits().max_current_a;
  if (a <= lim) return true;
  std::cerr << "[motor " << int(address_) << "] current " << a
            << " A above " << lim << " A\n";
  return false;
}

bool EncosMotor::check_torque_(double nm) const {
  const double lim = limits().max_torque_nm;
  if (within(nm, lim)) return true;
  std::cerr << "[motor " << int(address_) << "] torque " << nm
            << " Nm outside +/-" << lim << " Nm\n";
  return false;
}

// ================= commands =================

bool EncosMotor::send_command_(const CanFrame& f, const char* what) {
  bool ok = bus_.send_frame(f, send_timeout_);
  if (stats_) stats_->inc_tx(address_, ok);
  if (!ok) {
    std::cerr << "[motor " << int(address_) << "] " << what << " send failed\n";
    return false;
  }
  std::lock_guard<std::mutex> lk(mu_);
  last_command_tp_ = std::chrono::steady_clock::now();
  return true;
}

bool EncosMotor::set_zero_point() {
  if (!config_pacing_ok()) {
    std::cerr << "[motor " << int(address_) << "] set_zero within "
              << kCommandIntervalMs << " ms of the previous configuration command\n";
  }
  if (!send_command_(encode_set_zero(address_), "set_zero")) return false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    last_config_tp_ = last_command_tp_;
  }
  std::cout << "[motor " << int(address_) << "] zero point set\n";
  return true;
}

bool EncosMotor::set_position(double position_deg, double speed_limit_rpm,
                              double current_limit_a, MotorMode mode) {
  if (!check_position_(position_deg) || !check_velocity_(speed_limit_rpm) ||
      !check_current_(current_limit_a)) {
    if (stats_) stats_->inc_rejected(address_);
    return false;
  }

  CanFrame f;
  switch (mode) {
    case MotorMode::Servo:
      f = encode_servo_position(address_, position_deg, speed_limit_rpm, current_limit_a);
      break;
    case MotorMode::Force:
      f = encode_force_position(address_, kForceDefaultKp, kForceDefaultKd,
                                deg2rad(position_deg), 0.0, 0.0);
      break;
  }
  return send_command_(f, "set_position");
}

bool EncosMotor::set_force_position(double position_deg, double kp, double kd,
                                    double velocity_rad_s, double torque_nm) {
  if (!check_position_(position_deg) || !check_torque_(torque_nm)) {
    if (stats_) stats_->inc_rejected(address_);
    return false;
  }
  return send_command_(encode_force_position(address_, kp, kd, deg2rad(position_deg),
                                             velocity_rad_s, torque_nm),
                       "set_force_position");
}

bool EncosMotor::set_velocity(double velocity_rpm, double current_limit_a) {
  if (!check_velocity_(velocity_rpm) || !check_current_(current_limit_a)) {
    if (stats_) stats_->inc_rejected(address_);
    return false;
  }
  return send_command_(encode_servo_velocity(address_, velocity_rpm, current_limit_a),
                       "set_velocity");
}

bool EncosMotor::stop() { return set_velocity(0.0, 0.0); }

// ================= status =================

std::optional<Status> EncosMotor::get_status(FeedbackKind kind, std::chrono::milliseconds timeout,
                                             const std::atomic<bool>* cancel) {
  uint64_t start_seq = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    start_seq = status_seq_;
  }

  bool sent = bus_.send_frame(encode_status_request(address_, kind), send_timeout_);
  if (stats_) stats_->inc_tx(address_, sent);
  if (!sent) {
    std::cerr << "[motor " << int(address_) << "] status request send failed\n";
    return std::nullopt;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::unique_lock<std::mutex> lk(mu_);
  while (status_seq_ == start_seq) {
    if (cancel && cancel->load()) return std::nullopt;
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      lk.unlock();
      if (stats_) stats_->inc_timeout(address_);
      std::cerr << "[motor " << int(address_) << "] status request timed out after "
                << timeout.count() << " ms\n";
      return std::nullopt;
    }
    const auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, kWaitSlice);
    cv_status_.wait_for(lk, slice);
  }
  return status_;
}

void EncosMotor::on_frame(const CanFrame& f) {
  if (f.id != address_ || f.extended) return;

  auto st = decode_feedback(f);
  if (!st) {
    if (stats_) stats_->inc_decode_fail(address_);
    std::cerr << "[motor " << int(address_) << "] undecodable frame " << frame_to_string(f) << "\n";
    return;
  }
  if (stats_) stats_->inc_rx_status(address_, st->has_error());

  {
    std::lock_guard<std::mutex> lk(mu_);
    status_ = *st;
    status_seq_++;
  }
  cv_status_.notify_all();

  std::vector<std::pair<std::string, StatusCallback>> scbs;
  std::vector<std::pair<std::string, ErrorCallback>> ecbs;
  {
    std::lock_guard<std::mutex> lk(obs_mu_);
    scbs.assign(status_cbs_.begin(), status_cbs_.end());
    if (st->has_error()) ecbs.assign(error_cbs_.begin(), error_cbs_.end());
  }

  // An observer may drop the last reference to this motor: from here on only
  // locals are used.
  const int addr = address_;

  for (auto& [name, cb] : scbs) {
    try {
      cb(*st);
    } catch (const std::exception& e) {
      std::cerr << "[motor " << addr << "] status callback '" << name
                << "' threw: " << e.what() << "\n";
    } catch (...) {
      std::cerr << "[motor " << addr << "] status callback '" << name
                << "' threw a non-std exception\n";
    }
  }

  if (!st->has_error()) return;
  std::cerr << "[motor " << addr << "] error: " << to_string(st->error) << "\n";
  for (auto& [name, cb] : ecbs) {
    try {
      cb(st->error);
    } catch (const std::exception& e) {
      std::cerr << "[motor " << addr << "] error callback '" << name
                << "' threw: " << e.what() << "\n";
    } catch (...) {
      std::cerr << "[motor " << addr << "] error callback '" << name
                << "' threw a non-std exception\n";
    }
  }
}

std::optional<Status> EncosMotor::last_status() const {
  std::lock_guard<std::mutex> lk(mu_);
  return status_;
}

bool EncosMotor::is_heartbeat_alive() const {
  std::lock_guard<std::mutex> lk(mu_);
  if (!last_command_tp_) return true;
  return std::chrono::steady_clock::now() - *last_command_tp_ < kHeartbeatWindow;
}

bool EncosMotor::config_pacing_ok() const {
  std::lock_guard<std::mutex> lk(mu_);
  if (!last_config_tp_) return true;
  return std::chrono::steady_clock::now() - *last_config_tp_ >= kPacingWindow;
}

MotorInfo EncosMotor::info() const {
  MotorInfo i;
  i.address = address_;
  i.heartbeat_alive = is_heartbeat_alive();
  std::lock_guard<std::mutex> lk(mu_);
  i.limits = limits_;
  i.last_status = status_;
  if (last_command_tp_) {
    i.ms_since_command = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - *last_command_tp_).count();
  }
  return i;
}

// ================= observers =================

void EncosMotor::add_status_callback(const std::string& name, StatusCallback cb) {
  std::lock_guard<std::mutex> lk(obs_mu_);
  status_cbs_[name] = std::move(cb);
}

void EncosMotor::remove_status_callback(const std::string& name) {
  std::lock_guard<std::mutex> lk(obs_mu_);
  status_cbs_.erase(name);
}

void EncosMotor::add_error_callback(const std::string& name, ErrorCallback cb) {
  std::lock_guard<std::mutex> lk(obs_mu_);
  error_cbs_[name] = std::move(cb);
}

void EncosMotor::remove_error_callback(const std::string& name) {
  std::lock_guard<std::mutex> lk(obs_mu_);
  error_cbs_.erase(name);
}
