#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct CanFrame {
  uint32_t id = 0;          // 11-bit standard, or 29-bit when extended
  std::array<uint8_t,8> data{};
  uint8_t dlc = 8;
  bool extended = false;
};

std::string frame_to_string(const CanFrame& f);

struct TransportStats {
  bool connected = false;
  std::string name;
  uint64_t tx_ok = 0;
  uint64_t tx_fail = 0;
  uint64_t rx = 0;
  // Oldest frames evicted from the inbound queue. Only scan_addresses() reads
  // the queue, so this grows during normal traffic and is not a fault signal.
  uint64_t rx_dropped = 0;
  size_t queue_depth = 0;
};

using FrameCallback = std::function<void(const CanFrame&)>;

// Bus collaborator used by EncosMotor / MotorManager.
class CanTransport {
public:
  virtual ~CanTransport() = default;

  virtual bool connect() = 0;
  virtual void disconnect() = 0;
  virtual bool connected() const = 0;

  virtual bool send_frame(const CanFrame& f, std::chrono::milliseconds timeout) = 0;
  // Pops the next frame from the inbound queue.
  virtual std::optional<CanFrame> receive_frame(std::chrono::milliseconds timeout) = 0;
  virtual void flush_receive_queue() = 0;

  // Called on the receive thread for every inbound frame. A callback may add
  // or remove callbacks, including its own.
  virtual int  add_frame_callback(FrameCallback cb) = 0;
  // Returns once no delivery to this handle is running on another thread.
  virtual void remove_frame_callback(int handle) = 0;

  virtual TransportStats statistics() const = 0;
};

// ==========================
//  BusTransport: receive thread + bounded queue + callback fan-out
//  Subclasses only provide raw device access.
// ==========================
class BusTransport : public CanTransport {
public:
  explicit BusTransport(std::string name, size_t queue_capacity = 1024);
  ~BusTransport() override;

  BusTransport(const BusTransport&) = delete;
  BusTransport& operator=(const BusTransport&) = delete;

  bool connect() override;
  void disconnect() override;
  bool connected() const override { return connected_.load(); }

  bool send_frame(const CanFrame& f, std::chrono::milliseconds timeout) override;
  std::optional<CanFrame> receive_frame(std::chrono::milliseconds timeout) override;
  void flush_receive_queue() override;

  int  add_frame_callback(FrameCallback cb) override;
  void remove_frame_callback(int handle) override;

  TransportStats statistics() const override;

  const std::string& name() const { return name_; }

protected:
  virtual bool open_device_() = 0;
  virtual void close_device_() = 0;
  virtual bool write_device_(const CanFrame& f, std::chrono::milliseconds timeout) = 0;
  // false on timeout / no data
  virtual bool read_device_(CanFrame& out, std::chrono::milliseconds timeout) = 0;

  // Queue + callbacks, as if the frame had come off the wire.
  void deliver_(const CanFrame& f);

private:
  // Stops the receive thread. Subclass destructors call disconnect() so the
  // thread never reaches a half-destroyed read_device_().
  void shutdown_();
  void rx_loop_();

  std::string name_;
  size_t queue_capacity_;

  std::atomic<bool> connected_{false};
  std::atomic<bool> running_{false};
  std::thread rx_thread_;

  mutable std::mutex q_mu_;
  std::condition_variable q_cv_;
  std::deque<CanFrame> queue_;

  // Callbacks run unlocked. in_flight_ tracks deliveries by ticket so that
  // remove_frame_callback() can wait out the ones that started before it.
  std::mutex cb_mu_;
  std::condition_variable cb_cv_;
  std::map<int, FrameCallback> callbacks_;
  std::map<uint64_t, std::thread::id> in_flight_;
  uint64_t next_ticket_ = 0;
  int next_handle_ = 1;

  std::atomic<uint64_t> tx_ok_{0};
  std::atomic<uint64_t> tx_fail_{0};
  std::atomic<uint64_t> rx_{0};
  std::atomic<uint64_t> rx_dropped_{0};
};
