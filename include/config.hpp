#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "can_transport.hpp"
#include "motor.hpp"

enum class TransportType : uint8_t {
  SocketCan = 0,
  Usb2Can   = 1,
  Mock      = 2,
};

TransportType transport_type_from_string(const std::string& s);
const char* to_string(TransportType t);

struct TransportSpec {
  TransportType type = TransportType::SocketCan;
  std::string interface = "can0";          // socketcan
  std::string device = "/dev/USB2CAN0";    // usb2can
  uint8_t channel = 1;                     // usb2can: 1 or 2
  uint32_t bitrate = 1000000;              // informational; set on the interface itself
  int tx_delay_us = 75;
  size_t queue_capacity = 1024;
};

struct TimeoutSpec {
  int send_ms = 1000;
  int status_ms = 1000;
  int scan_ms = 3000;
};

struct AppConfig {
  TransportSpec transport;
  TimeoutSpec timeouts;
  SafetyLimits default_limits;
  std::map<uint8_t, SafetyLimits> motor_limits;
};

// Missing keys keep their defaults. throws std::runtime_error on bad values.
AppConfig load_config_yaml(const std::string& file);

// throws std::runtime_error for a backend this build does not include
std::unique_ptr<CanTransport> make_transport(const TransportSpec& spec);
