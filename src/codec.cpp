#include "codec.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace encos {

namespace {

CanFrame make_frame(uint32_t id, std::array<uint8_t,8> data) {
  CanFrame f;
  f.id = id;
  f.data = data;
  f.dlc = 8;
  f.extended = false;
  return f;
}

uint16_t clamp_u16(double v) {
  long r = std::lround(v);
  if (r < 0) r = 0;
  if (r > 65535) r = 65535;
  return (uint16_t)r;
}

// Integer gain, truncated, clamped to [0, max].
uint32_t gain_to_raw(double g, int max) {
  if (std::isnan(g) || g <= 0.0) return 0;
  if (g >= double(max)) return (uint32_t)max;
  return (uint32_t)g;
}

ErrorKind error_from_bits(uint8_t b) {
  // first set bit wins; lower-priority faults in the same byte are dropped
  if (b & 0x01) return ErrorKind::OverVoltage;
  if (b & 0x02) return ErrorKind::UnderVoltage;
  if (b & 0x04) return ErrorKind::OverCurrent;
  if (b & 0x08) return ErrorKind::OverTemperature;
  if (b & 0x10) return ErrorKind::EncoderFault;
  if (b & 0x20) return ErrorKind::HallFault;
  if (b != 0)   return ErrorKind::Unknown;
  return ErrorKind::None;
}

Status decode_pos_vel(const CanFrame& f, FeedbackKind kind) {
  const uint8_t* d = f.data.data();
  Status s;
  s.address = f.id;
  s.kind = kind;
  s.position_deg  = rad2deg(double(be16_load(d, 1)) * kPositionScale);
  s.velocity_rpm  = double(be16_load_signed(d, 3)) * kVelocityScale;
  s.temperature_c = double(d[7]) * kTemperatureScale;
  return s;
}

} // namespace

// ================= encoder =================

CanFrame encode_query_addresses() {
  return make_frame(kBroadcastId, {0x55, 0xAA, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00});
}

CanFrame encode_reset_address(int new_addr) {
  if (!valid_motor_id(new_addr))
    throw std::out_of_range("reset address must be 1..32, got " + std::to_string(new_addr));
  return make_frame(kBroadcastId, {0x55, 0xAA, 0x55, 0xAA, (uint8_t)new_addr, 0x00, 0x00, 0x00});
}

CanFrame encode_set_zero(uint8_t addr) {
  return make_frame(addr, {0x55, 0xAA, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00});
}

CanFrame encode_force_position(uint8_t addr, double kp, double kd,
                               double position_rad, double velocity_rad_s, double torque_nm) {
  const uint64_t kp_u  = gain_to_raw(kp, kKpMax);
  const uint64_t kd_u  = gain_to_raw(kd, kKdMax);
  const uint64_t pos_u = scale_to_range(position_rad, -kPi, kPi, kPosBits);
  const uint64_t vel_u = scale_to_range(velocity_rad_s, -kForceVelRange, kForceVelRange, kVelBits);
  const uint64_t tor_u = scale_to_range(torque_nm, -kForceTorRange, kForceTorRange, kTorBits);

  uint64_t word = 0;
  word |= (kp_u  & 0xFFF)  << 52;
  word |= (kd_u  & 0x1FF)  << 43;
  word |= (pos_u & 0xFFFF) << 27;
  word |= (vel_u & 0x7FF)  << 16;
  word |= (tor_u & 0x7FF)  << 5;

  std::array<uint8_t,8> d{};
  for (int i = 0; i < 8; ++i)
    d[i] = (uint8_t)((word >> (56 - 8 * i)) & 0xFF);
  return make_frame(addr, d);
}

CanFrame encode_servo_position(uint8_t addr, double position_deg,
                               double speed_limit_rpm, double current_limit_a) {
  std::array<uint8_t,8> d{};
  be_float_store(d, 0, (float)deg2rad(position_deg));
  be16_store(d, 4, clamp_u16(speed_limit_rpm * 10.0));
  be16_store(d, 6, clamp_u16(current_limit_a * 100.0));
  return make_frame(addr, d);
}

CanFrame encode_servo_velocity(uint8_t addr, double speed_rpm, double current_limit_a) {
  std::array<uint8_t,8> d{};
  be_float_store(d, 0, (float)speed_rpm);
  be_float_store(d, 4, (float)current_limit_a);
  return make_frame(addr, d);
}

CanFrame encode_status_request(uint8_t addr, FeedbackKind kind) {
  return make_frame(addr, {0xAA, 0x55, (uint8_t)kind, 0x00, 0x00, 0x00, 0x00, 0x00});
}

// ================= decoder =================

std::optional<Status> decode_feedback(const CanFrame& f) {
  if (f.dlc != 8) return std::nullopt;

  const uint8_t* d = f.data.data();
  const auto kind = feedback_kind_from_int((d[0] >> 5) & 0x07);
  if (!kind) return std::nullopt;

  switch (*kind) {
    case FeedbackKind::PosVelTorque: {
      Status s = decode_pos_vel(f, *kind);
      s.torque_nm = double(be16_load_signed(d, 5)) * kTorqueScale;
      return s;
    }
    case FeedbackKind::PosVelCurrent: {
      Status s = decode_pos_vel(f, *kind);
      s.current_a = double(be16_load_signed(d, 5)) * kCurrentScale;
      return s;
    }
    case FeedbackKind::PosVelWide: {
      Status s;
      s.address = f.id;
      s.kind = *kind;
      s.position_deg = rad2deg(double(be_float_load(d, 1)));
      // NOTE: velocity would be a float at bytes 5..8, one byte past the end of
      // an 8-byte frame. Reported as 0 until the device documentation settles it.
      s.velocity_rpm = 0.0;
      return s;
    }
    case FeedbackKind::DeviceState: {
      Status s;
      s.address = f.id;
      s.kind = *kind;
      s.temperature_c = double(d[1]) * kTemperatureScale;
      s.voltage_v     = double(be16_load(d, 2)) * kVoltageScale;
      return s;
    }
    case FeedbackKind::ErrorReport: {
      Status s;
      s.address = f.id;
      s.kind = *kind;
      s.error = error_from_bits(d[1]);
      return s;
    }
  }
  return std::nullopt;
}

std::optional<std::set<uint8_t>> decode_address_discovery(const CanFrame& f) {
  if (f.id != kBroadcastId) return std::nullopt;

  std::set<uint8_t> ids;
  for (int i = 0; i < f.dlc && i < 8; ++i) {
    if (valid_motor_id(f.data[i])) ids.insert(f.data[i]);
  }
  if (ids.empty()) return std::nullopt;
  return ids;
}

// ================= names =================

std::optional<FeedbackKind> feedback_kind_from_int(int v) {
  if (v < 1 || v > 5) return std::nullopt;
  return (FeedbackKind)v;
}

std::optional<MotorMode> motor_mode_from_string(const std::string& s) {
  if (s == "servo") return MotorMode::Servo;
  if (s == "force") return MotorMode::Force;
  return std::nullopt;
}

const char* to_string(FeedbackKind k) {
  switch (k) {
    case FeedbackKind::PosVelTorque:  return "pos/vel/torque";
    case FeedbackKind::PosVelCurrent: return "pos/vel/current";
    case FeedbackKind::PosVelWide:    return "pos/vel (float)";
    case FeedbackKind::DeviceState:   return "device state";
    case FeedbackKind::ErrorReport:   return "error report";
  }
  return "UNKNOWN";
}

const char* to_string(ErrorKind e) {
  switch (e) {
    case ErrorKind::None:            return "none";
    case ErrorKind::OverVoltage:     return "over-voltage";
    case ErrorKind::UnderVoltage:    return "under-voltage";
    case ErrorKind::OverCurrent:     return "over-current";
    case ErrorKind::OverTemperature: return "over-temperature";
    case ErrorKind::EncoderFault:    return "encoder fault";
    case ErrorKind::HallFault:       return "hall sensor fault";
    case ErrorKind::Unknown:         return "unknown error";
  }
  return "UNKNOWN";
}

const char* to_string(MotorMode m) {
  switch (m) {
    case MotorMode::Servo: return "servo";
    case MotorMode::Force: return "force";
  }
  return "UNKNOWN";
}

} // namespace encos
