#include "can_transport.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

std::string frame_to_string(const CanFrame& f) {
  std::ostringstream oss;
  oss << "id=0x" << std::hex << std::uppercase << std::setw(3) << std::setfill('0') << f.id
      << " data=";
  for (int i = 0; i < f.dlc && i < 8; ++i)
    oss << std::setw(2) << std::setfill('0') << int(f.data[i]);
  return oss.str();
}

BusTransport::BusTransport(std::string name, size_t queue_capacity)
: name_(std::move(name)), queue_capacity_(queue_capacity == 0 ? 1 : queue_capacity) {}

BusTransport::~BusTransport() { shutdown_(); }

void BusTransport::shutdown_() {
  running_.store(false);
  if (rx_thread_.joinable()) rx_thread_.join();
  connected_.store(false);
}

bool BusTransport::connect() {
  if (connected_.load()) return true;
  if (!open_device_()) {
    std::cerr << "[" << name_ << "] connect failed\n";
    return false;
  }
  connected_.store(true);
  running_.store(true);
  rx_thread_ = std::thread(&BusTransport::rx_loop_, this);
  std::cout << "[" << name_ << "] connected\n";
  return true;
}

void BusTransport::disconnect() {
  bool was = connected_.load();
  shutdown_();
  if (!was) return;
  close_device_();
  q_cv_.notify_all();
  std::cout << "[" << name_ << "] disconnected\n";
}

bool BusTransport::send_frame(const CanFrame& f, std::chrono::milliseconds timeout) {
  if (!connected_.load()) {
    std::cerr << "[" << name_ << "] send while not connected\n";
    tx_fail_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }
  if (f.dlc > 8) {
    std::cerr << "[" << name_ << "] invalid dlc=" << int(f.dlc) << "\n";
    tx_fail_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }
  if (!write_device_(f, timeout)) {
    std::cerr << "[" << name_ << "] send failed " << frame_to_string(f) << "\n";
    tx_fail_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }
  tx_ok_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

std::optional<CanFrame> BusTransport::receive_frame(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(q_mu_);
  bool ok = q_cv_.wait_for(lk, timeout, [&]{ return !queue_.empty(); });
  if (!ok) return std::nullopt;
  CanFrame f = queue_.front();
  queue_.pop_front();
  return f;
}

void BusTransport::flush_receive_queue() {
  std::lock_guard<std::mutex> lk(q_mu_);
  queue_.clear();
}

int BusTransport::add_frame_callback(FrameCallback cb) {
  std::lock_guard<std::mutex> lk(cb_mu_);
  const int h = next_handle_++;
  callbacks_[h] = std::move(cb);
  return h;
}

void BusTransport::remove_frame_callback(int handle) {
  std::unique_lock<std::mutex> lk(cb_mu_);
  callbacks_.erase(handle);

  // Removal from inside a delivery (an observer dropping its own motor) must
  // not wait, or the delivering thread would wait on itself.
  const auto self = std::this_thread::get_id();
  for (const auto& d : in_flight_) {
    if (d.second == self) return;
  }
  const uint64_t cut = next_ticket_;
  cb_cv_.wait(lk, [&]{
    return in_flight_.empty() || in_flight_.begin()->first >= cut;
  });
}

TransportStats BusTransport::statistics() const {
  TransportStats s;
  s.connected  = connected_.load();
  s.name       = name_;
  s.tx_ok      = tx_ok_.load(std::memory_order_relaxed);
  s.tx_fail    = tx_fail_.load(std::memory_order_relaxed);
  s.rx         = rx_.load(std::memory_order_relaxed);
  s.rx_dropped = rx_dropped_.load(std::memory_order_relaxed);
  {
    std::lock_guard<std::mutex> lk(q_mu_);
    s.queue_depth = queue_.size();
  }
  return s;
}

void BusTransport::deliver_(const CanFrame& f) {
  rx_.fetch_add(1, std::memory_order_relaxed);
  {
    std::lock_guard<std::mutex> lk(q_mu_);
    if (queue_.size() >= queue_capacity_) {
      queue_.pop_front();
      rx_dropped_.fetch_add(1, std::memory_order_relaxed);
    }
    queue_.push_back(f);
  }
  q_cv_.notify_one();

  std::vector<std::pair<int, FrameCallback>> cbs;
  uint64_t ticket = 0;
  {
    std::lock_guard<std::mutex> lk(cb_mu_);
    cbs.assign(callbacks_.begin(), callbacks_.end());
    ticket = next_ticket_++;
    in_flight_[ticket] = std::this_thread::get_id();
  }

  for (auto& [h, cb] : cbs) {
    {
      // removed by an earlier callback of this same delivery
      std::lock_guard<std::mutex> lk(cb_mu_);
      if (callbacks_.find(h) == callbacks_.end()) continue;
    }
    try {
      cb(f);
    } catch (const std::exception& e) {
      std::cerr << "[" << name_ << "] frame callback " << h << " threw: " << e.what() << "\n";
    } catch (...) {
      std::cerr << "[" << name_ << "] frame callback " << h << " threw a non-std exception\n";
    }
  }

  {
    std::lock_guard<std::mutex> lk(cb_mu_);
    in_flight_.erase(ticket);
  }
  cb_cv_.notify_all();
}

void BusTransport::rx_loop_() {
  CanFrame f{};
  int traced = 0;  // first frames after connect only

  while (running_.load(std::memory_order_relaxed)) {
    if (!read_device_(f, std::chrono::milliseconds(100))) continue;

    if (traced < 10) {
      ++traced;
      std::cout << "[" << name_ << "] RX " << frame_to_string(f) << "\n";
    }
    deliver_(f);
  }
}
