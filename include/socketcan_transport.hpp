#pragma once
#include <string>

#include "can_transport.hpp"

// Linux SocketCAN raw socket (classic CAN, 8-byte frames).
class SocketCanTransport : public BusTransport {
public:
  explicit SocketCanTransport(const std::string& interface_name, size_t queue_capacity = 1024);
  ~SocketCanTransport() override;

  const std::string& interface_name() const { return interface_name_; }

protected:
  bool open_device_() override;
  void close_device_() override;
  bool write_device_(const CanFrame& f, std::chrono::milliseconds timeout) override;
  bool read_device_(CanFrame& out, std::chrono::milliseconds timeout) override;

private:
  std::string interface_name_;
  int socket_fd_{-1};
};
