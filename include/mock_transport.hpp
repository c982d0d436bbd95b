#pragma once
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "can_transport.hpp"

// Hardware-free bus: records sent frames and plays back canned responses.
class MockCanTransport : public BusTransport {
public:
  explicit MockCanTransport(std::chrono::milliseconds response_delay = std::chrono::milliseconds(10),
                            size_t queue_capacity = 1024);
  ~MockCanTransport() override;

  // When a frame with this id and payload is sent, `response` is delivered after the delay.
  void set_response(uint32_t request_id, const std::array<uint8_t,8>& request_data,
                    const CanFrame& response);
  void clear_responses();

  // Deliver a frame immediately, as if received from the bus.
  void inject(const CanFrame& f);

  void set_fail_sends(bool fail) { fail_sends_.store(fail); }

  std::vector<CanFrame> sent_frames() const;
  size_t sent_count() const;
  void clear_sent();

protected:
  bool open_device_() override;
  void close_device_() override;
  bool write_device_(const CanFrame& f, std::chrono::milliseconds timeout) override;
  bool read_device_(CanFrame& out, std::chrono::milliseconds timeout) override;

private:
  void responder_loop_();

  using Key = std::pair<uint32_t, std::array<uint8_t,8>>;

  std::chrono::milliseconds response_delay_;
  std::atomic<bool> fail_sends_{false};

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::map<Key, CanFrame> responses_;
  std::vector<CanFrame> sent_;
  std::vector<std::pair<std::chrono::steady_clock::time_point, CanFrame>> pending_;
  bool stop_ = false;
  std::thread responder_;
};
