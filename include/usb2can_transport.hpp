#pragma once
#include <string>
#include <cstdint>
#include <mutex>
#include <chrono>

#include "can_transport.hpp"

// USB2CAN adapter (vendor usb_can driver). One transport per adapter channel.
class Usb2CanTransport : public BusTransport {
public:
  Usb2CanTransport(const std::string& dev_path, uint8_t channel,
                   int tx_delay_us = 75, size_t queue_capacity = 1024);
  ~Usb2CanTransport() override;

protected:
  bool open_device_() override;
  void close_device_() override;
  bool write_device_(const CanFrame& f, std::chrono::milliseconds timeout) override;
  bool read_device_(CanFrame& out, std::chrono::milliseconds timeout) override;

private:
  std::string path_;
  uint8_t channel_ = 1; // 1 or 2
  int fd_ = -1;

  // send pacing
  int tx_delay_us_{75};
  std::mutex tx_mu_;
  std::chrono::steady_clock::time_point last_tx_tp_{};
};
