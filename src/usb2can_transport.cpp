#include "usb2can_transport.hpp"

#include <iostream>
#include <stdexcept>
#include <thread>

#include "usb_can.h"

Usb2CanTransport::Usb2CanTransport(const std::string& dev_path, uint8_t channel,
                                   int tx_delay_us, size_t queue_capacity)
: BusTransport("usb2can:" + dev_path + "#" + std::to_string(int(channel)), queue_capacity),
  path_(dev_path), channel_(channel), tx_delay_us_(tx_delay_us)
{
  if (channel_ < 1 || channel_ > 2)
    throw std::out_of_range("Usb2CanTransport: invalid channel (expect 1/2)");
}

Usb2CanTransport::~Usb2CanTransport() { disconnect(); }

bool Usb2CanTransport::open_device_() {
  fd_ = openUSBCAN(path_.c_str());
  if (fd_ < 0) {
    std::cerr << "[usb2can] openUSBCAN failed: " << path_ << "\n";
    return false;
  }
  // first send is not delayed
  last_tx_tp_ = std::chrono::steady_clock::now() - std::chrono::microseconds(tx_delay_us_);
  std::cout << "[usb2can] opened " << path_ << " ch=" << int(channel_) << "\n";
  return true;
}

void Usb2CanTransport::close_device_() {
  if (fd_ >= 0) closeUSBCAN(fd_);
  fd_ = -1;
}

bool Usb2CanTransport::write_device_(const CanFrame& f, std::chrono::milliseconds timeout) {
  if (fd_ < 0) return false;

  std::lock_guard<std::mutex> lk(tx_mu_);
  if (tx_delay_us_ > 0) {
    auto now = std::chrono::steady_clock::now();
    auto used_us = std::chrono::duration_cast<std::chrono::microseconds>(now - last_tx_tp_).count();
    if (used_us < tx_delay_us_) {
      auto wait = std::chrono::microseconds(tx_delay_us_ - used_us);
      if (wait > timeout) return false;
      std::this_thread::sleep_for(wait);
    }
  }

  FrameInfo info{};
  info.canID = f.id;
  info.frameType = f.extended ? EXTENDED : STANDARD;
  info.dataLength = f.dlc;

  uint8_t raw[8];
  for (int i = 0; i < 8; i++)
    raw[i] = f.data[i];

  int ret = sendUSBCAN(fd_, channel_, &info, raw);
  last_tx_tp_ = std::chrono::steady_clock::now();
  return ret >= 0;
}

bool Usb2CanTransport::read_device_(CanFrame& out, std::chrono::milliseconds timeout) {
  if (fd_ < 0) return false;

  FrameInfo info_rx{};
  uint8_t channel = 0;
  uint8_t raw[8] = {0};

  int timeout_us = (int)std::chrono::duration_cast<std::chrono::microseconds>(timeout).count();
  int ret = readUSBCAN(fd_, &channel, &info_rx, raw, timeout_us);
  if (ret == -1) return false; // timeout or no data
  if (channel != channel_) return false;

  out.id = info_rx.canID;
  out.extended = (info_rx.frameType == EXTENDED);
  out.dlc = info_rx.dataLength > 8 ? 8 : info_rx.dataLength;
  for (int i = 0; i < 8; i++) out.data[i] = raw[i];
  return true;
}
