#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include "config/config.hpp"
#include "transport/endpoint.hpp"
#include "transport/message_source.hpp"

namespace byteproc {
namespace transport {

/**
 * Point-to-point TCP link carrying one length-prefixed frame.
 * In bind mode the socket listens from construction and accepts a single
 * peer; in connect mode it dials the endpoint, retrying as configured.
 * Every blocking step runs the private io_context on the calling thread
 * with a deadline.
 */
class QueueSocket {
public:
  QueueSocket(const QueueSocket&) = delete;
  QueueSocket& operator=(const QueueSocket&) = delete;
  virtual ~QueueSocket();

  // ---- GETTERS ----
  // Port the listener is bound to; 0 in connect mode
  uint16_t local_port() const;
  const Endpoint& endpoint() const { return endpoint_; }
  bool is_bind_mode() const { return bind_; }

protected:
  // ---- CONSTRUCTOR ----
  QueueSocket(const std::string& endpoint, bool bind, const config::QueueSettings& settings);

  // ---- CONNECTION ----
  // Accepts the peer or connects to it, whichever the mode requires
  void establish(int32_t timeout_ms);
  void close();

  // ---- DATA TRANSFER ----
  // Returns false if the peer closed the connection before any byte arrived
  bool read_exact(void* data, std::size_t size, int32_t timeout_ms);
  void write_all(const void* data, std::size_t size, int32_t timeout_ms);
  // Half-closes the link and waits up to linger_ms for the peer to hang up
  void linger(int32_t linger_ms);

  const config::QueueSettings& settings() const { return settings_; }

private:
  // ---- PARAMETERS ----
  Endpoint endpoint_;
  bool bind_;
  config::QueueSettings settings_;

  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::unique_ptr<boost::asio::ip::tcp::socket> socket_;
  bool connected_{false};


  // ---- CONNECTION ----
  void start_listener();
  void accept_peer(int32_t timeout_ms);
  void connect_to_peer(int32_t timeout_ms);
  // Runs pending handlers; on deadline cancels the socket and acceptor.
  // Returns false if the deadline expired.
  bool run_for(int32_t timeout_ms);
};

// Receives one frame from a pushing peer
class QueuePullSource : public MessageSource, public QueueSocket {
public:
  QueuePullSource(const std::string& endpoint, bool bind,
                  const config::QueueSettings& settings, std::size_t max_frame_size);

  std::string receive() override;
  const char* describe() const override { return "queue_pull"; }

private:
  std::size_t max_frame_size_;
};

// Sends one frame to a pulling peer
class QueuePushSink : public MessageSink, public QueueSocket {
public:
  QueuePushSink(const std::string& endpoint, bool bind, const config::QueueSettings& settings);

  void send(const std::string& message) override;
  const char* describe() const override { return "queue_push"; }
};

} // namespace transport
} // namespace byteproc
