#include "transport/queue_socket.hpp"
#include <array>
#include <chrono>
#include <functional>
#include <thread>
#include <boost/log/trivial.hpp>
#include "core/error.hpp"
#include "transport/frame_codec.hpp"

namespace byteproc {
namespace transport {

using boost::asio::ip::tcp;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

QueueSocket::QueueSocket(const std::string& endpoint, bool bind,
                         const config::QueueSettings& settings)
  : endpoint_(Endpoint::parse(endpoint))
  , bind_(bind)
  , settings_(settings)
  , socket_(std::make_unique<tcp::socket>(io_context_)) {
  if (!bind_ && endpoint_.is_wildcard()) {
    throw core::InvalidConfigurationError("cannot connect to wildcard endpoint " + endpoint);
  }
  if (bind_) {
    start_listener();
  }
}

QueueSocket::~QueueSocket() {
  close();
}


//==============================================
// CONNECTION
//==============================================

void QueueSocket::start_listener() {
  BOOST_LOG_TRIVIAL(debug) << "Queue socket: Binding " << endpoint_.to_string();

  try {
    tcp::endpoint local;
    if (endpoint_.is_wildcard()) {
      local = tcp::endpoint(tcp::v4(), endpoint_.port);
    } else {
      tcp::resolver resolver(io_context_);
      auto results = resolver.resolve(endpoint_.host, std::to_string(endpoint_.port));
      local = results.begin()->endpoint();
    }

    acceptor_ = std::make_unique<tcp::acceptor>(io_context_);
    acceptor_->open(local.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(local);
    acceptor_->listen();
  } catch (const boost::system::system_error& e) {
    throw core::TransportError("Failed to bind " + endpoint_.to_string() + ": " + e.what());
  }

  BOOST_LOG_TRIVIAL(info) << "Queue socket: Listening on " << endpoint_.host << ":" << local_port();
}

void QueueSocket::establish(int32_t timeout_ms) {
  if (connected_) {
    return;
  }
  if (bind_) {
    accept_peer(timeout_ms);
  } else {
    connect_to_peer(timeout_ms);
  }
  connected_ = true;
}

void QueueSocket::accept_peer(int32_t timeout_ms) {
  BOOST_LOG_TRIVIAL(debug) << "Queue socket: Waiting for peer on port " << local_port();

  boost::system::error_code result = boost::asio::error::would_block;
  acceptor_->async_accept(*socket_, [&result](const boost::system::error_code& ec) {
    result = ec;
  });

  if (!run_for(timeout_ms)) {
    throw core::TransportError("Timed out waiting for a peer on " + endpoint_.to_string());
  }
  if (result) {
    throw core::TransportError("Accept failed on " + endpoint_.to_string() + ": " + result.message());
  }

  boost::system::error_code ec;
  auto remote = socket_->remote_endpoint(ec);
  if (ec) {
    throw core::TransportError("Peer disconnected from " + endpoint_.to_string() + ": " + ec.message());
  }
  BOOST_LOG_TRIVIAL(info) << "Queue socket: Accepted peer " << remote;
}

void QueueSocket::connect_to_peer(int32_t timeout_ms) {
  tcp::resolver::results_type targets;
  try {
    tcp::resolver resolver(io_context_);
    targets = resolver.resolve(endpoint_.host, std::to_string(endpoint_.port));
  } catch (const boost::system::system_error& e) {
    throw core::TransportError("Cannot resolve " + endpoint_.to_string() + ": " + e.what());
  }

  const uint32_t attempts = settings_.max_reconnect_attempts + 1;
  std::string last_error;

  for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
    BOOST_LOG_TRIVIAL(debug) << "Queue socket: Connecting to " << endpoint_.to_string()
                             << " (attempt " << attempt << "/" << attempts << ")";

    boost::system::error_code result = boost::asio::error::would_block;
    boost::asio::async_connect(*socket_, targets,
      [&result](const boost::system::error_code& ec, const tcp::endpoint&) {
        result = ec;
      });

    if (!run_for(timeout_ms)) {
      last_error = "connection timed out";
    } else if (!result) {
      BOOST_LOG_TRIVIAL(info) << "Queue socket: Connected to " << endpoint_.to_string();
      return;
    } else {
      last_error = result.message();
    }

    BOOST_LOG_TRIVIAL(warning) << "Queue socket: Connect attempt " << attempt << " to "
                               << endpoint_.to_string() << " failed: " << last_error;
    boost::system::error_code ignored;
    socket_->close(ignored);

    if (attempt < attempts) {
      std::this_thread::sleep_for(std::chrono::milliseconds(settings_.reconnect_interval_ms));
    }
  }

  throw core::TransportError("Failed to connect to " + endpoint_.to_string() + " after " +
                             std::to_string(attempts) + " attempts: " + last_error);
}

void QueueSocket::close() {
  boost::system::error_code ec;
  if (socket_ && socket_->is_open()) {
    socket_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Queue socket: Error closing socket: " << ec.message();
    }
  }
  if (acceptor_ && acceptor_->is_open()) {
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "Queue socket: Error closing acceptor: " << ec.message();
    }
  }
  connected_ = false;
}

bool QueueSocket::run_for(int32_t timeout_ms) {
  io_context_.restart();

  // A negative timeout waits forever
  if (timeout_ms < 0) {
    io_context_.run();
    return true;
  }

  io_context_.run_for(std::chrono::milliseconds(timeout_ms));
  if (io_context_.stopped()) {
    return true;
  }

  // Deadline expired: abort the pending operation and drain its handler
  boost::system::error_code ignored;
  socket_->cancel(ignored);
  if (acceptor_) {
    acceptor_->cancel(ignored);
  }
  io_context_.restart();
  io_context_.run();
  return false;
}


//==============================================
// DATA TRANSFER
//==============================================

bool QueueSocket::read_exact(void* data, std::size_t size, int32_t timeout_ms) {
  boost::system::error_code result = boost::asio::error::would_block;
  std::size_t transferred = 0;
  boost::asio::async_read(*socket_, boost::asio::buffer(data, size),
    [&result, &transferred](const boost::system::error_code& ec, std::size_t bytes) {
      result = ec;
      transferred = bytes;
    });

  if (!run_for(timeout_ms)) {
    throw core::TransportError("Timed out reading from " + endpoint_.to_string());
  }
  if (result == boost::asio::error::eof && transferred == 0) {
    return false;
  }
  if (result) {
    throw core::TransportError("Read from " + endpoint_.to_string() + " failed after " +
                               std::to_string(transferred) + " of " + std::to_string(size) +
                               " bytes: " + result.message());
  }
  return true;
}

void QueueSocket::write_all(const void* data, std::size_t size, int32_t timeout_ms) {
  boost::system::error_code result = boost::asio::error::would_block;
  boost::asio::async_write(*socket_, boost::asio::buffer(data, size),
    [&result](const boost::system::error_code& ec, std::size_t) {
      result = ec;
    });

  if (!run_for(timeout_ms)) {
    throw core::TransportError("Timed out writing to " + endpoint_.to_string());
  }
  if (result) {
    throw core::TransportError("Write to " + endpoint_.to_string() + " failed: " + result.message());
  }
}

void QueueSocket::linger(int32_t linger_ms) {
  boost::system::error_code ec;
  socket_->shutdown(tcp::socket::shutdown_send, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Queue socket: Shutdown failed: " << ec.message();
    return;
  }
  if (linger_ms == 0) {
    return;
  }

  // Wait for the peer to close its side; anything it sends is discarded
  std::array<char, 256> scratch;
  bool peer_closed = false;
  std::function<void(const boost::system::error_code&, std::size_t)> on_read;
  on_read = [&](const boost::system::error_code& read_ec, std::size_t) {
    if (read_ec) {
      peer_closed = true;
      return;
    }
    socket_->async_read_some(boost::asio::buffer(scratch), on_read);
  };
  socket_->async_read_some(boost::asio::buffer(scratch), on_read);

  if (!run_for(linger_ms) || !peer_closed) {
    BOOST_LOG_TRIVIAL(debug) << "Queue socket: Linger period ended before peer closed";
  }
}

uint16_t QueueSocket::local_port() const {
  if (!acceptor_ || !acceptor_->is_open()) {
    return 0;
  }
  boost::system::error_code ec;
  auto local = acceptor_->local_endpoint(ec);
  return ec ? 0 : local.port();
}


//==============================================
// PULL SOURCE
//==============================================

QueuePullSource::QueuePullSource(const std::string& endpoint, bool bind,
                                 const config::QueueSettings& settings,
                                 std::size_t max_frame_size)
  : QueueSocket(endpoint, bind, settings)
  , max_frame_size_(max_frame_size) {}

std::string QueuePullSource::receive() {
  const int32_t timeout = settings().receive_timeout_ms;
  establish(timeout);

  FrameCodec::Header header;
  if (!read_exact(header.data(), header.size(), timeout)) {
    throw core::TransportError("Peer closed " + endpoint().to_string() +
                               " without sending a message");
  }

  const uint32_t length = FrameCodec::decode_header(header);
  BOOST_LOG_TRIVIAL(debug) << "Queue pull: Expecting " << length << " bytes";
  if (length > max_frame_size_) {
    throw core::TransportError("Frame of " + std::to_string(length) +
                               " bytes exceeds limit of " + std::to_string(max_frame_size_));
  }

  std::string payload(length, '\0');
  if (length > 0 && !read_exact(&payload[0], length, timeout)) {
    throw core::TransportError("Peer closed " + endpoint().to_string() + " mid-frame");
  }

  close();
  BOOST_LOG_TRIVIAL(info) << "Queue pull: Received message of " << length << " bytes";
  return payload;
}


//==============================================
// PUSH SINK
//==============================================

QueuePushSink::QueuePushSink(const std::string& endpoint, bool bind,
                             const config::QueueSettings& settings)
  : QueueSocket(endpoint, bind, settings) {}

void QueuePushSink::send(const std::string& message) {
  const int32_t timeout = settings().send_timeout_ms;
  establish(timeout);

  const std::string frame = FrameCodec::encode(message);
  write_all(frame.data(), frame.size(), timeout);
  linger(settings().linger_ms);
  close();

  BOOST_LOG_TRIVIAL(info) << "Queue push: Sent message of " << message.size() << " bytes";
}

} // namespace transport
} // namespace byteproc
