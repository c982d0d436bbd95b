#include "config.hpp"
#include "util.hpp"
#include "encos_protocol.hpp"
#include "mock_transport.hpp"
#include "socketcan_transport.hpp"
#ifdef ENCOS_WITH_USB2CAN
#include "usb2can_transport.hpp"
#endif
#include <yaml-cpp/yaml.h>
#include <stdexcept>

static uint8_t parse_motor_id(const YAML::Node& n) {
  if (!n || !n.IsScalar()) throw std::runtime_error("motor entry missing 'id'");
  uint32_t v = parse_u32_hex_or_dec(n.as<std::string>());
  if (!encos::valid_motor_id((int)v))
    throw std::runtime_error("motor id out of range 1..32: " + n.as<std::string>());
  return (uint8_t)v;
}

static double positive(const YAML::Node& n, double fallback, const char* key) {
  if (!n) return fallback;
  double v = n.as<double>();
  if (!(v >= 0.0)) throw std::runtime_error(std::string("limit must be >= 0: ") + key);
  return v;
}

static SafetyLimits parse_limits(const YAML::Node& n, SafetyLimits base) {
  if (!n) return base;
  base.max_position_deg = positive(n["max_position_deg"], base.max_position_deg, "max_position_deg");
  base.max_velocity_rpm = positive(n["max_velocity_rpm"], base.max_velocity_rpm, "max_velocity_rpm");
  base.max_current_a    = positive(n["max_current_a"],    base.max_current_a,    "max_current_a");
  base.max_torque_nm    = positive(n["max_torque_nm"],    base.max_torque_nm,    "max_torque_nm");
  return base;
}

TransportType transport_type_from_string(const std::string& s) {
  if (s == "socketcan") return TransportType::SocketCan;
  if (s == "usb2can")   return TransportType::Usb2Can;
  if (s == "mock")      return TransportType::Mock;
  throw std::runtime_error("unknown transport type: " + s);
}

const char* to_string(TransportType t) {
  switch (t) {
    case TransportType::SocketCan: return "socketcan";
    case TransportType::Usb2Can:   return "usb2can";
    case TransportType::Mock:      return "mock";
  }
  return "UNKNOWN";
}

AppConfig load_config_yaml(const std::string& file) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(file);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("cannot load " + file + ": " + e.what());
  }
  AppConfig cfg;

  try {
    if (auto t = root["transport"]) {
      if (t["type"]) cfg.transport.type = transport_type_from_string(t["type"].as<std::string>());
      if (t["interface"]) cfg.transport.interface = t["interface"].as<std::string>();
      if (t["device"]) cfg.transport.device = t["device"].as<std::string>();
      if (t["channel"]) {
        int ch = t["channel"].as<int>();
        if (ch != 1 && ch != 2) throw std::runtime_error("channel must be 1 or 2");
        cfg.transport.channel = (uint8_t)ch;
      }
      if (t["bitrate"]) cfg.transport.bitrate = t["bitrate"].as<uint32_t>();
      if (t["tx_delay_us"]) cfg.transport.tx_delay_us = t["tx_delay_us"].as<int>();
      if (t["queue_capacity"]) cfg.transport.queue_capacity = t["queue_capacity"].as<size_t>();
    }

    if (auto to = root["timeouts"]) {
      if (to["send_ms"]) cfg.timeouts.send_ms = to["send_ms"].as<int>();
      if (to["status_ms"]) cfg.timeouts.status_ms = to["status_ms"].as<int>();
      if (to["scan_ms"]) cfg.timeouts.scan_ms = to["scan_ms"].as<int>();
      if (cfg.timeouts.send_ms <= 0 || cfg.timeouts.status_ms <= 0 || cfg.timeouts.scan_ms <= 0)
        throw std::runtime_error("timeouts must be > 0");
    }

    cfg.default_limits = parse_limits(root["limits"], cfg.default_limits);

    if (auto motors = root["motors"]) {
      if (!motors.IsSequence()) throw std::runtime_error("'motors' must be a list");
      for (const auto& mN : motors) {
        uint8_t id = parse_motor_id(mN["id"]);
        cfg.motor_limits[id] = parse_limits(mN, cfg.default_limits);
      }
    }
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("bad config " + file + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error("bad config " + file + ": " + e.what());
  } catch (const std::out_of_range& e) {
    throw std::runtime_error("bad config " + file + ": " + e.what());
  }
  return cfg;
}

std::unique_ptr<CanTransport> make_transport(const TransportSpec& spec) {
  switch (spec.type) {
    case TransportType::SocketCan:
      return std::make_unique<SocketCanTransport>(spec.interface, spec.queue_capacity);
    case TransportType::Usb2Can:
#ifdef ENCOS_WITH_USB2CAN
      return std::make_unique<Usb2CanTransport>(spec.device, spec.channel, spec.tx_delay_us,
                                                spec.queue_capacity);
#else
      throw std::runtime_error("built without the usb2can backend");
#endif
    case TransportType::Mock:
      return std::make_unique<MockCanTransport>(std::chrono::milliseconds(10), spec.queue_capacity);
  }
  throw std::runtime_error("unknown transport type");
}
