#pragma once
#include <cstdint>
#include <array>
#include <cstring>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>

namespace encos {

constexpr double kPi = 3.14159265358979323846;

// ---- addressing ----
constexpr uint32_t kBroadcastId  = 0x000;
constexpr uint8_t  kMinMotorId   = 1;
constexpr uint8_t  kMaxMotorId   = 32;

// ---- timing (ms) ----
constexpr int kHeartbeatTimeoutMs = 500;
constexpr int kCommandIntervalMs  = 500;

constexpr uint32_t kDefaultBitrate = 1000000;

// ---- feedback scaling (physical value per LSB) ----
constexpr double kPositionScale    = 2.0 * kPi / 65536.0; // rad
constexpr double kVelocityScale    = 0.1;                 // RPM
constexpr double kCurrentScale     = 0.01;                // A
constexpr double kTorqueScale      = 0.01;                // N*m
constexpr double kTemperatureScale = 0.1;                 // degC
constexpr double kVoltageScale     = 0.1;                 // V

// ---- force/position command field widths ----
constexpr int kKpBits  = 12;
constexpr int kKdBits  = 9;
constexpr int kPosBits = 16;
constexpr int kVelBits = 11;
constexpr int kTorBits = 11;

constexpr int kKpMax  = 4095;
constexpr int kKdMax  = 511;
constexpr int kPosMax = 65535;
constexpr int kVelMax = 2047;
constexpr int kTorMax = 2047;

constexpr double kForceVelRange = 10.0; // rad/s, symmetric
constexpr double kForceTorRange = 10.0; // N*m, symmetric

inline bool valid_motor_id(int id) { return id >= kMinMotorId && id <= kMaxMotorId; }

enum class FeedbackKind : uint8_t {
  PosVelTorque   = 1,
  PosVelCurrent  = 2,
  PosVelWide     = 3,
  DeviceState    = 4,
  ErrorReport    = 5,
};

enum class ErrorKind : uint8_t {
  None            = 0x00,
  OverVoltage     = 0x01,
  UnderVoltage    = 0x02,
  OverCurrent     = 0x04,
  OverTemperature = 0x08,
  EncoderFault    = 0x10,
  HallFault       = 0x20,
  Unknown         = 0xFF,
};

enum class MotorMode : uint8_t {
  Servo = 0,
  Force = 1,
};

std::optional<FeedbackKind> feedback_kind_from_int(int v);
std::optional<MotorMode>    motor_mode_from_string(const std::string& s);

const char* to_string(FeedbackKind k);
const char* to_string(ErrorKind e);
const char* to_string(MotorMode m);

// Decoded feedback. Fields a feedback kind does not carry stay at zero.
struct Status {
  uint32_t address = 0;
  double position_deg  = 0.0;
  double velocity_rpm  = 0.0;
  double current_a     = 0.0;
  double torque_nm     = 0.0;
  double temperature_c = 0.0;
  double voltage_v     = 0.0;
  ErrorKind error = ErrorKind::None;
  FeedbackKind kind = FeedbackKind::PosVelTorque;

  bool has_error() const { return error != ErrorKind::None; }
};

inline double deg2rad(double d) { return d * kPi / 180.0; }
inline double rad2deg(double r) { return r * 180.0 / kPi; }

inline double full_scale(int bits) {
  if (bits <= 0 || bits >= 32) throw std::out_of_range("field width must be 1..31 bits");
  return double((1u << bits) - 1u);
}

// Clamp v into [lo, hi] and map it onto 0 .. 2^bits-1 (truncating). NaN maps to lo.
// Throws std::out_of_range unless bits is 1..31.
inline uint32_t scale_to_range(double v, double lo, double hi, int bits) {
  const double full = full_scale(bits);
  if (std::isnan(v)) v = lo;
  if (v < lo) v = lo;
  if (v > hi) v = hi;
  const double ratio = (v - lo) / (hi - lo);
  return (uint32_t)(ratio * full);
}

inline double unscale_from_range(uint32_t raw, double lo, double hi, int bits) {
  const double full = full_scale(bits);
  return lo + (double(raw) / full) * (hi - lo);
}

// ---- big-endian helpers ----
inline void be16_store(std::array<uint8_t,8>& d, int idx, uint16_t v) {
  d[idx]   = (uint8_t)(v >> 8);
  d[idx+1] = (uint8_t)(v & 0xFF);
}

inline uint16_t be16_load(const uint8_t* d, int idx) {
  return (uint16_t)(((uint16_t)d[idx] << 8) | (uint16_t)d[idx + 1]);
}

inline int16_t be16_load_signed(const uint8_t* d, int idx) {
  return (int16_t)be16_load(d, idx);
}

inline void be32_store(std::array<uint8_t,8>& d, int idx, uint32_t v) {
  d[idx]   = (uint8_t)(v >> 24);
  d[idx+1] = (uint8_t)(v >> 16);
  d[idx+2] = (uint8_t)(v >> 8);
  d[idx+3] = (uint8_t)(v & 0xFF);
}

inline uint32_t be32_load(const uint8_t* d, int idx) {
  return ((uint32_t)d[idx] << 24) |
         ((uint32_t)d[idx + 1] << 16) |
         ((uint32_t)d[idx + 2] << 8) |
         (uint32_t)d[idx + 3];
}

inline uint32_t float_bits(float f) {
  uint32_t u = 0;
  std::memcpy(&u, &f, 4);
  return u;
}

inline float float_from_bits(uint32_t u) {
  float f = 0.f;
  std::memcpy(&f, &u, 4);
  return f;
}

// IEEE-754 single precision, most significant byte first.
inline void be_float_store(std::array<uint8_t,8>& d, int idx, float f) {
  be32_store(d, idx, float_bits(f));
}

inline float be_float_load(const uint8_t* d, int idx) {
  return float_from_bits(be32_load(d, idx));
}

} // namespace encos
