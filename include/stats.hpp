#pragma once
#include <array>
#include <atomic>
#include <cstdint>
#include <chrono>
#include <ostream>

#include "encos_protocol.hpp"

struct MotorCounters {
  std::atomic<uint64_t> tx_command{0};   // attempts
  std::atomic<uint64_t> tx_ok{0};
  std::atomic<uint64_t> tx_fail{0};
  std::atomic<uint64_t> rejected{0};     // safety gate
  std::atomic<uint64_t> rx_status{0};
  std::atomic<uint64_t> rx_error{0};     // status with an error kind
  std::atomic<uint64_t> decode_fail{0};
  std::atomic<uint64_t> timeouts{0};
};

struct CounterSnapshot {
  uint64_t tx_command = 0, tx_ok = 0, tx_fail = 0, rejected = 0;
  uint64_t rx_status = 0, rx_error = 0, decode_fail = 0, timeouts = 0;
};

// Per-address traffic counters, index 0 is the broadcast id.
class Stats {
public:
  void inc_tx(uint8_t addr, bool ok);
  void inc_rejected(uint8_t addr);
  void inc_rx_status(uint8_t addr, bool has_error);
  void inc_decode_fail(uint8_t addr);
  void inc_timeout(uint8_t addr);

  CounterSnapshot snapshot(uint8_t addr) const;
  CounterSnapshot total() const;

  // rates since the previous call; prints nothing if called again within 1s
  void print_periodic(std::ostream& os);

private:
  MotorCounters& at_(uint8_t addr);

  std::array<MotorCounters, encos::kMaxMotorId + 1> motors_{};
  MotorCounters overflow_;  // ids outside 0..32

  CounterSnapshot last_total_{};
  std::chrono::steady_clock::time_point last_print_ = std::chrono::steady_clock::now();
  std::chrono::steady_clock::time_point start_ = std::chrono::steady_clock::now();
};
