// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace draftops {
namespace network {

// host:port split; nullopt if malformed
struct Endpoint {
  std::string host;
  uint16_t port{0};
};
std::optional<Endpoint> ParseEndpoint(const std::string &target);

/**
 * TcpFrameTransport - newline-delimited frames over a TCP socket
 *
 * Each connection gets a fresh io_context run by one IO thread; all socket
 * I/O after connect() happens on that thread. Frame and disconnect
 * callbacks run on the IO thread.
 *
 * refresh() sends a PING frame, which the stream answers with PONG.
 */
class TcpFrameTransport : public FrameTransport {
public:
  TcpFrameTransport();
  ~TcpFrameTransport() override;

  TcpFrameTransport(const TcpFrameTransport &) = delete;
  TcpFrameTransport &operator=(const TcpFrameTransport &) = delete;

  // FrameTransport interface
  bool connect(const std::string &target) override;
  bool refresh() override;
  void close() override;
  bool is_open() const override { return open_; }
  void set_frame_callback(FrameCallback callback) override;
  void set_disconnect_callback(DisconnectCallback callback) override;

  // Queue an outbound frame (newline appended)
  bool send_frame(const std::string &frame);

private:
  // Outbound queue, touched only on the IO thread
  struct WriteQueue {
    std::deque<std::shared_ptr<std::string>> frames;
    bool writing{false};
  };

  void start_read(uint64_t generation);
  void do_write(std::shared_ptr<WriteQueue> queue, uint64_t generation);
  void deliver_disconnect_once(uint64_t generation, const std::string &reason);
  void shutdown_io();

  std::mutex mutex_; // guards io_context_, socket_ and the IO threads
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::unique_ptr<boost::asio::ip::tcp::socket> socket_;
  std::thread io_thread_;
  std::shared_ptr<boost::asio::streambuf> read_buffer_;
  std::shared_ptr<WriteQueue> write_queue_;

  // A connection closed from its own IO thread is parked here and
  // joined by the next connect(), close() or the destructor
  std::thread retired_thread_;
  std::unique_ptr<boost::asio::io_context> retired_context_;
  std::unique_ptr<boost::asio::ip::tcp::socket> retired_socket_;

  std::mutex callback_mutex_;
  FrameCallback frame_callback_;
  DisconnectCallback disconnect_callback_;

  std::atomic<bool> open_{false};
  // Bumped per connection and on close() so stale handlers stay silent
  std::atomic<uint64_t> generation_{0};
  std::atomic<uint64_t> disconnect_delivered_for_{0};

  static constexpr std::chrono::seconds CONNECT_TIMEOUT{10};
};

} // namespace network
} // namespace draftops
