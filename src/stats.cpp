#include "stats.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

// YYYY-MM-DD HH:MM:SS.mmm, local time
static std::string wall_now_string() {
  using namespace std::chrono;
  auto tp = system_clock::now();
  auto t  = system_clock::to_time_t(tp);

  std::tm tm{};
  localtime_r(&t, &tm);

  auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;

  std::ostringstream oss;
  oss << std::put_time(&tm, "%F %T")
      << "." << std::setw(3) << std::setfill('0') << ms.count();
  return oss.str();
}

static CounterSnapshot load(const MotorCounters& c) {
  CounterSnapshot s;
  s.tx_command  = c.tx_command.load(std::memory_order_relaxed);
  s.tx_ok       = c.tx_ok.load(std::memory_order_relaxed);
  s.tx_fail     = c.tx_fail.load(std::memory_order_relaxed);
  s.rejected    = c.rejected.load(std::memory_order_relaxed);
  s.rx_status   = c.rx_status.load(std::memory_order_relaxed);
  s.rx_error    = c.rx_error.load(std::memory_order_relaxed);
  s.decode_fail = c.decode_fail.load(std::memory_order_relaxed);
  s.timeouts    = c.timeouts.load(std::memory_order_relaxed);
  return s;
}

MotorCounters& Stats::at_(uint8_t addr) {
  if (addr < motors_.size()) return motors_[addr];
  return overflow_;
}

void Stats::inc_tx(uint8_t addr, bool ok) {
  auto& c = at_(addr);
  c.tx_command.fetch_add(1, std::memory_order_relaxed);
  if (ok) c.tx_ok.fetch_add(1, std::memory_order_relaxed);
  else    c.tx_fail.fetch_add(1, std::memory_order_relaxed);
}

void Stats::inc_rejected(uint8_t addr)    { at_(addr).rejected.fetch_add(1, std::memory_order_relaxed); }
void Stats::inc_decode_fail(uint8_t addr) { at_(addr).decode_fail.fetch_add(1, std::memory_order_relaxed); }
void Stats::inc_timeout(uint8_t addr)     { at_(addr).timeouts.fetch_add(1, std::memory_order_relaxed); }

void Stats::inc_rx_status(uint8_t addr, bool has_error) {
  auto& c = at_(addr);
  c.rx_status.fetch_add(1, std::memory_order_relaxed);
  if (has_error) c.rx_error.fetch_add(1, std::memory_order_relaxed);
}

CounterSnapshot Stats::snapshot(uint8_t addr) const {
  if (addr < motors_.size()) return load(motors_[addr]);
  return load(overflow_);
}

CounterSnapshot Stats::total() const {
  CounterSnapshot t{};
  auto add = [&](const MotorCounters& c) {
    auto s = load(c);
    t.tx_command  += s.tx_command;
    t.tx_ok       += s.tx_ok;
    t.tx_fail     += s.tx_fail;
    t.rejected    += s.rejected;
    t.rx_status   += s.rx_status;
    t.rx_error    += s.rx_error;
    t.decode_fail += s.decode_fail;
    t.timeouts    += s.timeouts;
  };
  for (const auto& c : motors_) add(c);
  add(overflow_);
  return t;
}

void Stats::print_periodic(std::ostream& os) {
  auto now = std::chrono::steady_clock::now();
  double dt = std::chrono::duration<double>(now - last_print_).count();
  double elapsed = std::chrono::duration<double>(now - start_).count();
  if (dt < 1.0) return;
  last_print_ = now;

  const CounterSnapshot t = total();
  const CounterSnapshot& p = last_total_;
  auto rate = [&](uint64_t a, uint64_t b){ return double(a - b) / dt; };

  os << "\n[" << wall_now_string() << "]"
     << " [t=" << std::fixed << std::setprecision(3) << elapsed << "s]\n"
     << "TX=" << (t.tx_command - p.tx_command) << " (" << rate(t.tx_command, p.tx_command) << " Hz)  "
     << "TX_ok=" << (t.tx_ok - p.tx_ok) << "  "
     << "TX_fail=" << (t.tx_fail - p.tx_fail) << "  "
     << "rejected=" << (t.rejected - p.rejected) << "\n"
     << "RX_status=" << (t.rx_status - p.rx_status) << " (" << rate(t.rx_status, p.rx_status) << " Hz)  "
     << "RX_error=" << (t.rx_error - p.rx_error) << "  "
     << "decode_fail=" << (t.decode_fail - p.decode_fail) << "  "
     << "timeouts=" << (t.timeouts - p.timeouts) << "\n";

  for (size_t a = 1; a < motors_.size(); ++a) {
    auto s = load(motors_[a]);
    if (s.tx_command == 0 && s.rx_status == 0 && s.timeouts == 0) continue;
    os << "  motor " << std::setw(2) << a
       << ": TX_ok=" << s.tx_ok << " TX_fail=" << s.tx_fail
       << " rejected=" << s.rejected
       << " RX_status=" << s.rx_status << " RX_error=" << s.rx_error
       << " timeouts=" << s.timeouts << "\n";
  }
  os << "======================================\n";

  last_total_ = t;
}
