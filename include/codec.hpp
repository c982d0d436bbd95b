#pragma once
#include <cstdint>
#include <optional>
#include <set>

#include "can_transport.hpp"
#include "encos_protocol.hpp"

namespace encos {

// ---- encoder: one function per command, no I/O ----
CanFrame encode_query_addresses();
// throws std::out_of_range unless new_addr is 1..32
CanFrame encode_reset_address(int new_addr);
CanFrame encode_set_zero(uint8_t addr);

// Force/position hybrid command. Fields are clamped then packed MSB-first:
//   kp[63:52] kd[51:43] pos[42:27] vel[26:16] tor[15:5], bits 4..0 zero.
CanFrame encode_force_position(uint8_t addr, double kp, double kd,
                               double position_rad, double velocity_rad_s, double torque_nm);

CanFrame encode_servo_position(uint8_t addr, double position_deg,
                               double speed_limit_rpm, double current_limit_a);
CanFrame encode_servo_velocity(uint8_t addr, double speed_rpm, double current_limit_a);
CanFrame encode_status_request(uint8_t addr, FeedbackKind kind);

// ---- decoder ----
// nullopt on dlc != 8 or an unrecognised kind in byte0[7:5].
std::optional<Status> decode_feedback(const CanFrame& f);

// Reply to encode_query_addresses(): every payload byte in 1..32 is an address.
std::optional<std::set<uint8_t>> decode_address_discovery(const CanFrame& f);

} // namespace encos
