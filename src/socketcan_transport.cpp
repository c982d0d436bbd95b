#include "socketcan_transport.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>

#include <linux/can.h>
#include <linux/can/raw.h>
#include <net/if.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

SocketCanTransport::SocketCanTransport(const std::string& interface_name, size_t queue_capacity)
: BusTransport("socketcan:" + interface_name, queue_capacity), interface_name_(interface_name) {}

SocketCanTransport::~SocketCanTransport() { disconnect(); }

bool SocketCanTransport::open_device_() {
  if (socket_fd_ >= 0) return true;

  socket_fd_ = ::socket(PF_CAN, SOCK_RAW, CAN_RAW);
  if (socket_fd_ < 0) {
    std::cerr << "[socketcan] socket() failed: " << std::strerror(errno) << "\n";
    return false;
  }

  struct ifreq ifr;
  std::memset(&ifr, 0, sizeof(ifr));
  std::strncpy(ifr.ifr_name, interface_name_.c_str(), IFNAMSIZ - 1);
  ifr.ifr_name[IFNAMSIZ - 1] = '\0';

  if (::ioctl(socket_fd_, SIOCGIFINDEX, &ifr) < 0) {
    std::cerr << "[socketcan] no such interface " << interface_name_
              << ": " << std::strerror(errno) << "\n";
    ::close(socket_fd_);
    socket_fd_ = -1;
    return false;
  }

  struct sockaddr_can addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.can_family = AF_CAN;
  addr.can_ifindex = ifr.ifr_ifindex;

  if (::bind(socket_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::cerr << "[socketcan] bind failed: " << std::strerror(errno) << "\n";
    ::close(socket_fd_);
    socket_fd_ = -1;
    return false;
  }

  std::cout << "[socketcan] opened " << interface_name_ << "\n";
  return true;
}

void SocketCanTransport::close_device_() {
  if (socket_fd_ >= 0) {
    ::close(socket_fd_);
    socket_fd_ = -1;
  }
}

bool SocketCanTransport::write_device_(const CanFrame& f, std::chrono::milliseconds timeout) {
  if (socket_fd_ < 0) return false;

  struct pollfd pfd;
  pfd.fd = socket_fd_;
  pfd.events = POLLOUT;
  if (::poll(&pfd, 1, (int)timeout.count()) <= 0) return false;

  struct can_frame frame;
  std::memset(&frame, 0, sizeof(frame));
  frame.can_id = f.extended ? ((f.id & CAN_EFF_MASK) | CAN_EFF_FLAG) : (f.id & CAN_SFF_MASK);
  frame.can_dlc = f.dlc;
  std::memcpy(frame.data, f.data.data(), f.dlc);

  ssize_t n = ::write(socket_fd_, &frame, sizeof(frame));
  return n == static_cast<ssize_t>(sizeof(frame));
}

bool SocketCanTransport::read_device_(CanFrame& out, std::chrono::milliseconds timeout) {
  if (socket_fd_ < 0) return false;

  struct pollfd pfd;
  pfd.fd = socket_fd_;
  pfd.events = POLLIN;
  int ret = ::poll(&pfd, 1, (int)timeout.count());
  if (ret <= 0) return false;

  struct can_frame frame;
  ssize_t n = ::read(socket_fd_, &frame, sizeof(frame));
  if (n < static_cast<ssize_t>(sizeof(frame))) return false;
  if (frame.can_id & (CAN_ERR_FLAG | CAN_RTR_FLAG)) return false;

  out.extended = (frame.can_id & CAN_EFF_FLAG) != 0;
  out.id = out.extended ? (frame.can_id & CAN_EFF_MASK) : (frame.can_id & CAN_SFF_MASK);
  out.dlc = frame.can_dlc > 8 ? 8 : frame.can_dlc;
  out.data.fill(0);
  std::memcpy(out.data.data(), frame.data, out.dlc);
  return true;
}
