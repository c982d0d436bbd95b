#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "codec.hpp"
#include "config.hpp"
#include "motor_manager.hpp"
#include "util.hpp"

static std::atomic<bool> g_stop{false};
static void on_sigint(int) { g_stop.store(true); }

namespace {

const char* kUsage =
  "Usage: encos_cli [--config FILE] [--type socketcan|usb2can|mock] [--interface NAME]\n"
  "                 [--device PATH] [--channel 1|2] <command> [args]\n"
  "\n"
  "Commands:\n"
  "  scan [--timeout S]                          discover motors on the bus\n"
  "  zero ID                                     set current position as zero\n"
  "  setid NEW_ID                                broadcast re-addressing (one motor on bus!)\n"
  "  pos ID ANGLE [SPEED] [CURRENT] [--mode servo|force]\n"
  "  vel ID RPM [CURRENT]\n"
  "  stop [ID[,ID...]]                           zero velocity (scans the bus if no ID)\n"
  "  status ID [--type 1..5]\n"
  "  monitor ID [--interval S] [--type 1..5]     Ctrl+C to stop\n"
  "  config                                      print effective configuration\n";

struct Args {
  std::vector<std::string> pos;
  std::vector<std::pair<std::string, std::string>> opts;

  std::string opt(const std::string& k, const std::string& def) const {
    for (const auto& [key, v] : opts) if (key == k) return v;
    return def;
  }
};

Args split_args(const std::vector<std::string>& in) {
  Args a;
  for (size_t i = 0; i < in.size(); ++i) {
    const auto& k = in[i];
    if (k.rfind("--", 0) == 0) {
      if (i + 1 >= in.size()) throw std::invalid_argument("missing value for " + k);
      a.opts.emplace_back(k, in[++i]);
    } else {
      a.pos.push_back(k);
    }
  }
  return a;
}

double parse_double(const std::string& s, const char* what) {
  size_t pos = 0;
  double v = 0.0;
  try {
    v = std::stod(s, &pos);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string("invalid ") + what + ": " + s);
  }
  if (pos != s.size()) throw std::invalid_argument(std::string("invalid ") + what + ": " + s);
  return v;
}

uint8_t parse_motor_id(const std::string& s) {
  uint32_t v = parse_u32_hex_or_dec(s);
  if (!encos::valid_motor_id((int)v))
    throw std::out_of_range("motor id must be 1..32, got " + s);
  return (uint8_t)v;
}

encos::FeedbackKind parse_kind(const std::string& s) {
  auto k = encos::feedback_kind_from_int((int)parse_u32_hex_or_dec(s));
  if (!k) throw std::out_of_range("feedback type must be 1..5, got " + s);
  return *k;
}

std::chrono::milliseconds seconds_arg(const std::string& s, const char* what) {
  try {
    return parse_seconds(s);
  } catch (const std::out_of_range& e) {
    throw std::out_of_range(std::string(what) + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    throw std::invalid_argument(std::string(what) + ": " + e.what());
  }
}

void need_pos(const Args& a, size_t n, const char* cmd) {
  if (a.pos.size() < n) throw std::invalid_argument(std::string("missing arguments for ") + cmd);
}

void print_status(const encos::Status& s) {
  std::cout << std::fixed
            << "motor " << s.address << "  [" << encos::to_string(s.kind) << "]\n"
            << "  position    : " << std::setprecision(2) << s.position_deg << " deg\n"
            << "  velocity    : " << std::setprecision(2) << s.velocity_rpm << " RPM\n";
  if (s.current_a != 0.0)
    std::cout << "  current     : " << std::setprecision(2) << s.current_a << " A\n";
  if (s.torque_nm != 0.0)
    std::cout << "  torque      : " << std::setprecision(3) << s.torque_nm << " Nm\n";
  std::cout << "  temperature : " << std::setprecision(1) << s.temperature_c << " C\n";
  if (s.voltage_v != 0.0)
    std::cout << "  voltage     : " << std::setprecision(1) << s.voltage_v << " V\n";
  std::cout << "  error       : " << encos::to_string(s.error) << "\n";
}

void print_config(const AppConfig& cfg, const CanTransport* bus) {
  const auto& t = cfg.transport;
  std::cout << "transport: type=" << to_string(t.type)
            << " interface=" << t.interface
            << " device=" << t.device
            << " channel=" << int(t.channel)
            << " bitrate=" << t.bitrate
            << " tx_delay_us=" << t.tx_delay_us
            << " queue_capacity=" << t.queue_capacity << "\n";
  std::cout << "timeouts: send=" << cfg.timeouts.send_ms << "ms status=" << cfg.timeouts.status_ms
            << "ms scan=" << cfg.timeouts.scan_ms << "ms\n";
  auto print_lim = [](const SafetyLimits& l) {
    std::cout << "pos<=" << l.max_position_deg << "deg vel<=" << l.max_velocity_rpm
              << "rpm cur<=" << l.max_current_a << "A tor<=" << l.max_torque_nm << "Nm\n";
  };
  std::cout << "limits (default): ";
  print_lim(cfg.default_limits);
  for (const auto& [id, l] : cfg.motor_limits) {
    std::cout << "limits motor " << int(id) << ": ";
    print_lim(l);
  }
  if (bus) {
    auto s = bus->statistics();
    std::cout << "bus " << s.name << ": connected=" << s.connected
              << " tx_ok=" << s.tx_ok << " tx_fail=" << s.tx_fail
              << " rx=" << s.rx << " dropped=" << s.rx_dropped
              << " queued=" << s.queue_depth << "\n";
  }
}

// sleep that returns early on Ctrl+C
void interruptible_sleep(std::chrono::milliseconds d) {
  const auto until = std::chrono::steady_clock::now() + d;
  while (!g_stop.load() && std::chrono::steady_clock::now() < until) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
}

int run_command(const std::string& cmd, const Args& a, const AppConfig& cfg, MotorManager& mgr) {
  const auto status_timeout = std::chrono::milliseconds(cfg.timeouts.status_ms);

  if (cmd == "scan") {
    auto timeout = a.opt("--timeout", "").empty()
                       ? std::chrono::milliseconds(cfg.timeouts.scan_ms)
                       : seconds_arg(a.opt("--timeout", ""), "timeout");
    auto ids = mgr.scan_addresses(timeout, &g_stop);
    if (ids.empty()) {
      std::cout << "no motors found\n";
      return 0;
    }
    std::cout << ids.size() << " motor(s):";
    for (auto id : ids) std::cout << " " << int(id);
    std::cout << "\n";
    return 0;
  }

  if (cmd == "zero") {
    need_pos(a, 1, "zero");
    auto m = mgr.add_motor(parse_motor_id(a.pos[0]));
    return m->set_zero_point() ? 0 : 1;
  }

  if (cmd == "setid") {
    need_pos(a, 1, "setid");
    return mgr.reset_address((int)parse_u32_hex_or_dec(a.pos[0])) ? 0 : 1;
  }

  if (cmd == "pos") {
    need_pos(a, 2, "pos");
    auto m = mgr.add_motor(parse_motor_id(a.pos[0]));
    double angle   = parse_double(a.pos[1], "angle");
    double speed   = a.pos.size() > 2 ? parse_double(a.pos[2], "speed") : 100.0;
    double current = a.pos.size() > 3 ? parse_double(a.pos[3], "current") : 5.0;
    auto mode = encos::motor_mode_from_string(a.opt("--mode", "servo"));
    if (!mode) throw std::out_of_range("mode must be servo or force");
    bool ok = m->set_position(angle, speed, current, *mode);
    std::cout << (ok ? "position command sent\n" : "position command rejected\n");
    return ok ? 0 : 1;
  }

  if (cmd == "vel") {
    need_pos(a, 2, "vel");
    auto m = mgr.add_motor(parse_motor_id(a.pos[0]));
    double rpm     = parse_double(a.pos[1], "rpm");
    double current = a.pos.size() > 2 ? parse_double(a.pos[2], "current") : 5.0;
    bool ok = m->set_velocity(rpm, current);
    std::cout << (ok ? "velocity command sent\n" : "velocity command rejected\n");
    return ok ? 0 : 1;
  }

  if (cmd == "stop") {
    if (!a.pos.empty()) {
      for (const auto& id : split_csv(a.pos[0])) mgr.add_motor(parse_motor_id(id));
    } else {
      mgr.discover_motors(std::chrono::milliseconds(cfg.timeouts.scan_ms), &g_stop);
    }
    size_t n = mgr.size();
    if (n == 0) {
      std::cout << "no motors to stop\n";
      return 0;
    }
    return mgr.stop_all() == n ? 0 : 1;
  }

  if (cmd == "status") {
    need_pos(a, 1, "status");
    auto m = mgr.add_motor(parse_motor_id(a.pos[0]));
    auto st = m->get_status(parse_kind(a.opt("--type", "1")), status_timeout, &g_stop);
    if (!st) {
      std::cout << "no response\n";
      return 1;
    }
    print_status(*st);
    return 0;
  }

  if (cmd == "monitor") {
    need_pos(a, 1, "monitor");
    auto m = mgr.add_motor(parse_motor_id(a.pos[0]));
    auto kind = parse_kind(a.opt("--type", "1"));
    auto interval = seconds_arg(a.opt("--interval", "0.5"), "interval");

    std::cout << "monitoring motor " << int(m->address()) << " (Ctrl+C to stop)\n";
    while (!g_stop.load()) {
      auto st = m->get_status(kind, status_timeout, &g_stop);
      if (st) {
        std::cout << "============================================================\n";
        print_status(*st);
      } else if (!g_stop.load()) {
        std::cout << "." << std::flush;
      }
      mgr.stats().print_periodic(std::cout);
      interruptible_sleep(interval);
    }
    std::cout << "\nmonitor stopped\n";
    return 0;
  }

  throw std::invalid_argument("unknown command: " + cmd);
}

} // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, on_sigint);

  std::string config_path;
  std::vector<std::pair<std::string, std::string>> overrides;
  std::string cmd;
  std::vector<std::string> rest;

  for (int i = 1; i < argc; ++i) {
    std::string k = argv[i];
    if (!cmd.empty()) { rest.push_back(k); continue; }
    if (k == "--help" || k == "-h") {
      std::cout << kUsage;
      return 0;
    }
    if (k.rfind("--", 0) == 0) {
      if (i + 1 >= argc) {
        std::cerr << "missing value for " << k << "\n";
        return 1;
      }
      std::string v = argv[++i];
      if (k == "--config") config_path = v;
      else overrides.emplace_back(k, v);
      continue;
    }
    cmd = k;
  }

  if (cmd.empty()) {
    std::cout << kUsage;
    return 0;
  }

  AppConfig cfg;
  try {
    if (!config_path.empty()) cfg = load_config_yaml(config_path);
    for (const auto& [k, v] : overrides) {
      if (k == "--type") cfg.transport.type = transport_type_from_string(v);
      else if (k == "--interface") cfg.transport.interface = v;
      else if (k == "--device") cfg.transport.device = v;
      else if (k == "--channel") {
        uint32_t ch = parse_u32_hex_or_dec(v);
        if (ch != 1 && ch != 2) throw std::out_of_range("channel must be 1 or 2");
        cfg.transport.channel = (uint8_t)ch;
      }
      else throw std::invalid_argument("unknown option " + k);
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  std::unique_ptr<CanTransport> bus;
  try {
    bus = make_transport(cfg.transport);
  } catch (const std::exception& e) {
    if (cmd == "config") print_config(cfg, nullptr);
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  if (cmd == "config") {
    print_config(cfg, bus.get());
    return 0;
  }
  if (!bus->connect()) {
    std::cerr << "[main] failed to connect " << to_string(cfg.transport.type) << " bus\n";
    return 1;
  }

  int rc = 1;
  {
    MotorManager mgr(*bus, cfg.default_limits, std::chrono::milliseconds(cfg.timeouts.send_ms));
    for (const auto& [id, l] : cfg.motor_limits) mgr.set_limits_for(id, l);

    try {
      rc = run_command(cmd, split_args(rest), cfg, mgr);
    } catch (const std::exception& e) {
      std::cerr << "[main] " << cmd << " failed: " << e.what() << "\n";
      rc = 1;
    }

    if (g_stop.load() && mgr.size() > 0) mgr.stop_all();
  }
  bus->disconnect();
  return rc;
}
