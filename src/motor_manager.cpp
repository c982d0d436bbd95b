#include "motor_manager.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

#include "codec.hpp"

using namespace encos;

MotorManager::MotorManager(CanTransport& bus, SafetyLimits default_limits,
                           std::chrono::milliseconds send_timeout)
: bus_(bus), send_timeout_(send_timeout), stats_(std::make_shared<Stats>()),
  default_limits_(default_limits) {}

std::shared_ptr<EncosMotor> MotorManager::add_motor(uint8_t addr) {
  if (!valid_motor_id(addr))
    throw std::out_of_range("motor address must be 1..32, got " + std::to_string(int(addr)));

  SafetyLimits lim;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = motors_.find(addr);
    if (it != motors_.end()) return it->second;
    auto lit = per_motor_limits_.find(addr);
    lim = (lit != per_motor_limits_.end()) ? lit->second : default_limits_;
  }

  // built unlocked: the constructor registers with the bus, whose receive
  // thread may be inside an observer that reads this manager
  auto m = std::make_shared<EncosMotor>(bus_, addr, lim, stats_, send_timeout_);
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto [it, inserted] = motors_.emplace(addr, m);
    if (!inserted) return it->second;  // lost a race; m unregisters on return
    // set_limits_for() may have run while the motor was being built
    auto lit = per_motor_limits_.find(addr);
    if (lit != per_motor_limits_.end()) m->set_limits(lit->second);
  }
  std::cout << "[manager] added motor " << int(addr) << "\n";
  return m;
}

void MotorManager::remove_motor(uint8_t addr) {
  std::shared_ptr<EncosMotor> gone;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = motors_.find(addr);
    if (it == motors_.end()) return;
    gone = std::move(it->second);
    motors_.erase(it);
  }
  // destroyed outside the lock (unregisters from the bus)
  gone.reset();
  std::cout << "[manager] removed motor " << int(addr) << "\n";
}

std::shared_ptr<EncosMotor> MotorManager::get_motor(uint8_t addr) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = motors_.find(addr);
  if (it == motors_.end()) return nullptr;
  return it->second;
}

std::vector<uint8_t> MotorManager::addresses() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<uint8_t> out;
  out.reserve(motors_.size());
  for (const auto& [a, m] : motors_) out.push_back(a);
  return out;
}

size_t MotorManager::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return motors_.size();
}

void MotorManager::set_default_limits(const SafetyLimits& l) {
  std::lock_guard<std::mutex> lk(mu_);
  default_limits_ = l;
}

void MotorManager::set_limits_for(uint8_t addr, const SafetyLimits& l) {
  std::lock_guard<std::mutex> lk(mu_);
  per_motor_limits_[addr] = l;
  auto it = motors_.find(addr);
  if (it != motors_.end()) it->second->set_limits(l);
}

std::vector<std::shared_ptr<EncosMotor>> MotorManager::snapshot_() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::shared_ptr<EncosMotor>> out;
  out.reserve(motors_.size());
  for (const auto& [a, m] : motors_) out.push_back(m);
  return out;
}

std::vector<uint8_t> MotorManager::scan_addresses(std::chrono::milliseconds timeout,
                                                  const std::atomic<bool>* cancel) {
  // stale frames would otherwise count as replies
  bus_.flush_receive_queue();

  bool ok = bus_.send_frame(encode_query_addresses(), send_timeout_);
  stats_->inc_tx(kBroadcastId, ok);
  if (!ok) {
    std::cerr << "[manager] address query send failed\n";
    return {};
  }

  std::set<uint8_t> found;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (cancel && cancel->load()) break;
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) break;

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    auto f = bus_.receive_frame(std::min(remaining, std::chrono::milliseconds(100)));
    if (!f) continue;

    auto ids = decode_address_discovery(*f);
    if (!ids) continue;
    found.insert(ids->begin(), ids->end());
  }

  std::vector<uint8_t> out(found.begin(), found.end());
  std::cout << "[manager] scan found " << out.size() << " motor(s):";
  for (auto a : out) std::cout << " " << int(a);
  std::cout << "\n";
  return out;
}

std::vector<uint8_t> MotorManager::discover_motors(std::chrono::milliseconds timeout,
                                                   const std::atomic<bool>* cancel) {
  auto ids = scan_addresses(timeout, cancel);
  for (auto a : ids) add_motor(a);
  return ids;
}

bool MotorManager::reset_address(int new_addr) {
  const CanFrame f = encode_reset_address(new_addr);
  bool ok = bus_.send_frame(f, send_timeout_);
  stats_->inc_tx(kBroadcastId, ok);
  if (!ok) {
    std::cerr << "[manager] reset address to " << new_addr << " send failed\n";
    return false;
  }
  std::cout << "[manager] broadcast reset address -> " << new_addr << "\n";
  return true;
}

size_t MotorManager::stop_all() {
  size_t stopped = 0;
  for (auto& m : snapshot_()) {
    if (m->stop()) ++stopped;
    else std::cerr << "[manager] stop failed for motor " << int(m->address()) << "\n";
  }
  std::cout << "[manager] stopped " << stopped << " motor(s)\n";
  return stopped;
}

std::map<uint8_t, std::optional<Status>> MotorManager::get_all_status(
    FeedbackKind kind, std::chrono::milliseconds timeout, const std::atomic<bool>* cancel) {
  std::map<uint8_t, std::optional<Status>> out;
  for (auto& m : snapshot_()) {
    out[m->address()] = m->get_status(kind, timeout, cancel);
  }
  return out;
}
