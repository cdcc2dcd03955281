// Copyright (c) 2025 The Unicity Foundation
// TCP frame transport implementation using boost::asio

#include "network/tcp_transport.hpp"
#include "protocol/protocol.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"

namespace draftops {
namespace network {

std::optional<Endpoint> ParseEndpoint(const std::string &target) {
  auto colon = target.rfind(':');
  if (colon == std::string::npos || colon == 0) {
    return std::nullopt;
  }
  auto port = util::SafeParsePort(target.substr(colon + 1));
  if (!port) {
    return std::nullopt;
  }
  std::string host = target.substr(0, colon);
  // [::1]:9000
  if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }
  return Endpoint{host, *port};
}

TcpFrameTransport::TcpFrameTransport() = default;

TcpFrameTransport::~TcpFrameTransport() {
  // Destructor must not log; the logging subsystem may already be gone
  std::lock_guard<std::mutex> lock(mutex_);
  generation_++;
  open_ = false;
  shutdown_io();
}

void TcpFrameTransport::set_frame_callback(FrameCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  frame_callback_ = std::move(callback);
}

void TcpFrameTransport::set_disconnect_callback(DisconnectCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  disconnect_callback_ = std::move(callback);
}

bool TcpFrameTransport::connect(const std::string &target) {
  auto endpoint = ParseEndpoint(target);
  if (!endpoint) {
    LOG_NET_ERROR("Invalid stream target '{}', expected host:port", target);
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  generation_++;
  open_ = false;
  shutdown_io();

  io_context_ = std::make_unique<boost::asio::io_context>();
  socket_ = std::make_unique<boost::asio::ip::tcp::socket>(*io_context_);
  read_buffer_ = std::make_shared<boost::asio::streambuf>(protocol::MAX_FRAME_LENGTH + 2);
  write_queue_ = std::make_shared<WriteQueue>();

  // Resolve and connect on this thread, bounded by CONNECT_TIMEOUT
  boost::asio::ip::tcp::resolver resolver(*io_context_);
  boost::system::error_code ec;
  auto results = resolver.resolve(endpoint->host, std::to_string(endpoint->port), ec);
  if (ec) {
    LOG_NET_WARN("Failed to resolve {}: {}", endpoint->host, ec.message());
    shutdown_io();
    return false;
  }

  bool done = false;
  boost::system::error_code connect_ec = boost::asio::error::timed_out;
  boost::asio::async_connect(
      *socket_, results,
      [&](const boost::system::error_code &result, const boost::asio::ip::tcp::endpoint &) {
        done = true;
        connect_ec = result;
      });
  io_context_->run_for(CONNECT_TIMEOUT);
  if (!done) {
    LOG_NET_WARN("Connect to {} timed out after {}s", target, CONNECT_TIMEOUT.count());
    shutdown_io();
    return false;
  }
  if (connect_ec) {
    LOG_NET_WARN("Failed to connect to {}: {}", target, connect_ec.message());
    shutdown_io();
    return false;
  }

  boost::system::error_code opt_ec;
  socket_->set_option(boost::asio::ip::tcp::no_delay(true), opt_ec);
  socket_->set_option(boost::asio::socket_base::keep_alive(true), opt_ec);

  open_ = true;
  io_context_->restart();
  work_guard_ = std::make_unique<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
      io_context_->get_executor());
  start_read(generation_.load());

  boost::asio::io_context *io = io_context_.get();
  io_thread_ = std::thread([io]() { io->run(); });

  LOG_NET_INFO("Connected to draft stream {}", target);
  return true;
}

void TcpFrameTransport::start_read(uint64_t generation) {
  // Handlers hold the buffers by value; socket_ and io_context_ outlive
  // them because shutdown_io() joins the IO thread before releasing either
  auto buffer = read_buffer_;
  boost::asio::async_read_until(
      *socket_, *buffer, '\n',
      [this, generation, buffer](const boost::system::error_code &ec, size_t n) {
        if (generation != generation_.load()) {
          return; // connection replaced or closed locally
        }
        if (ec) {
          open_ = false;
          std::string reason;
          if (ec == boost::asio::error::eof) {
            reason = "connection closed by peer";
          } else if (ec == boost::asio::error::not_found) {
            reason = "frame exceeds maximum length";
          } else {
            reason = ec.message();
          }
          deliver_disconnect_once(generation, reason);
          return;
        }

        std::string line(boost::asio::buffers_begin(buffer->data()),
                         boost::asio::buffers_begin(buffer->data()) +
                             static_cast<std::ptrdiff_t>(n));
        buffer->consume(n);
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
          line.pop_back();
        }

        FrameCallback callback;
        {
          std::lock_guard<std::mutex> lock(callback_mutex_);
          callback = frame_callback_;
        }
        if (callback) {
          try {
            callback(FrameDirection::INBOUND, line);
          } catch (const std::exception &e) {
            LOG_NET_WARN("Exception in frame callback: {}", e.what());
          }
        }

        if (open_ && generation == generation_.load()) {
          start_read(generation);
        }
      });
}

void TcpFrameTransport::deliver_disconnect_once(uint64_t generation,
                                                const std::string &reason) {
  uint64_t previous = disconnect_delivered_for_.exchange(generation);
  if (previous == generation) {
    return;
  }

  DisconnectCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = disconnect_callback_;
  }
  LOG_NET_WARN("Draft stream disconnected: {}", reason);
  if (callback) {
    try {
      callback(reason);
    } catch (const std::exception &e) {
      LOG_NET_WARN("Exception in disconnect callback: {}", e.what());
    }
  }
}

bool TcpFrameTransport::send_frame(const std::string &frame) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_ || !io_context_) {
    return false;
  }

  auto payload = std::make_shared<std::string>(frame + "\n");
  auto queue = write_queue_;
  const uint64_t generation = generation_.load();

  boost::asio::post(*io_context_, [this, payload, queue, generation]() {
    if (generation != generation_.load()) {
      return;
    }
    queue->frames.push_back(payload);
    if (!queue->writing) {
      do_write(queue, generation);
    }
  });

  FrameCallback callback;
  {
    std::lock_guard<std::mutex> cb_lock(callback_mutex_);
    callback = frame_callback_;
  }
  if (callback) {
    try {
      callback(FrameDirection::OUTBOUND, frame);
    } catch (const std::exception &e) {
      LOG_NET_WARN("Exception in frame callback: {}", e.what());
    }
  }
  return true;
}

void TcpFrameTransport::do_write(std::shared_ptr<WriteQueue> queue, uint64_t generation) {
  if (queue->frames.empty()) {
    queue->writing = false;
    return;
  }
  queue->writing = true;
  auto payload = queue->frames.front();
  boost::asio::async_write(
      *socket_, boost::asio::buffer(*payload),
      [this, queue, payload, generation](const boost::system::error_code &ec, size_t) {
        if (generation != generation_.load()) {
          return;
        }
        if (ec) {
          open_ = false;
          deliver_disconnect_once(generation, "write failed: " + ec.message());
          return;
        }
        queue->frames.pop_front();
        do_write(queue, generation);
      });
}

bool TcpFrameTransport::refresh() {
  if (!open_) {
    return false;
  }
  return send_frame(protocol::commands::PING);
}

void TcpFrameTransport::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  generation_++;
  if (open_.exchange(false)) {
    LOG_NET_DEBUG("Closing draft stream connection");
  }
  shutdown_io();
}

// Caller holds mutex_
void TcpFrameTransport::shutdown_io() {
  const auto self = std::this_thread::get_id();

  if (retired_thread_.joinable() && retired_thread_.get_id() != self) {
    retired_thread_.join();
    retired_socket_.reset();
    retired_context_.reset();
  }

  if (!io_context_) {
    return;
  }

  if (socket_) {
    boost::asio::post(*io_context_, [socket = socket_.get()]() {
      boost::system::error_code ignored;
      socket->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
      socket->close(ignored);
    });
  }
  work_guard_.reset();
  io_context_->stop();

  if (io_thread_.joinable() && io_thread_.get_id() == self) {
    // Called from a callback on the IO thread; cannot join ourselves
    retired_thread_ = std::move(io_thread_);
    retired_socket_ = std::move(socket_);
    retired_context_ = std::move(io_context_);
    return;
  }
  if (io_thread_.joinable()) {
    io_thread_.join();
  }

  if (socket_) {
    boost::system::error_code ignored;
    socket_->close(ignored);
  }
  socket_.reset();
  io_context_.reset();
}

} // namespace network
} // namespace draftops
