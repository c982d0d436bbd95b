#include "mock_transport.hpp"

#include <algorithm>
#include <iostream>

MockCanTransport::MockCanTransport(std::chrono::milliseconds response_delay, size_t queue_capacity)
: BusTransport("mock", queue_capacity), response_delay_(response_delay) {
  responder_ = std::thread(&MockCanTransport::responder_loop_, this);
}

MockCanTransport::~MockCanTransport() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = true;
  }
  cv_.notify_all();
  if (responder_.joinable()) responder_.join();
  disconnect();
}

void MockCanTransport::set_response(uint32_t request_id, const std::array<uint8_t,8>& request_data,
                                    const CanFrame& response) {
  std::lock_guard<std::mutex> lk(mu_);
  responses_[Key{request_id, request_data}] = response;
}

void MockCanTransport::clear_responses() {
  std::lock_guard<std::mutex> lk(mu_);
  responses_.clear();
}

void MockCanTransport::inject(const CanFrame& f) { deliver_(f); }

std::vector<CanFrame> MockCanTransport::sent_frames() const {
  std::lock_guard<std::mutex> lk(mu_);
  return sent_;
}

size_t MockCanTransport::sent_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return sent_.size();
}

void MockCanTransport::clear_sent() {
  std::lock_guard<std::mutex> lk(mu_);
  sent_.clear();
}

bool MockCanTransport::open_device_() { return true; }

void MockCanTransport::close_device_() {
  std::lock_guard<std::mutex> lk(mu_);
  pending_.clear();
}

bool MockCanTransport::write_device_(const CanFrame& f, std::chrono::milliseconds) {
  if (fail_sends_.load()) return false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    sent_.push_back(f);
    auto it = responses_.find(Key{f.id, f.data});
    if (it != responses_.end()) {
      pending_.emplace_back(std::chrono::steady_clock::now() + response_delay_, it->second);
    }
  }
  cv_.notify_all();
  return true;
}

// Nothing comes off a wire; frames arrive through inject() / the responder.
bool MockCanTransport::read_device_(CanFrame&, std::chrono::milliseconds timeout) {
  std::this_thread::sleep_for(timeout);
  return false;
}

void MockCanTransport::responder_loop_() {
  std::unique_lock<std::mutex> lk(mu_);
  while (!stop_) {
    if (pending_.empty()) {
      cv_.wait(lk, [&]{ return stop_ || !pending_.empty(); });
      continue;
    }
    auto next = std::min_element(pending_.begin(), pending_.end(),
                                 [](const auto& a, const auto& b){ return a.first < b.first; });
    const auto due = next->first;
    if (std::chrono::steady_clock::now() < due) {
      cv_.wait_until(lk, due);
      continue;
    }
    CanFrame f = next->second;
    pending_.erase(next);

    lk.unlock();
    if (connected()) deliver_(f);
    lk.lock();
  }
}
