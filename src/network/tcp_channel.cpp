#include "network/tcp_channel.hpp"
#include "network/network_error.hpp"
#include <algorithm>
#include <array>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace sft {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TCP_Channel::TCP_Channel(boost::asio::ip::tcp::socket socket, uint64_t max_frame_size)
  : socket_(std::move(socket))
  , max_frame_size_(max_frame_size)
  , connected_(socket_.is_open()) {
  BOOST_LOG_TRIVIAL(info) << "TCP channel: Created channel, connected: " << std::boolalpha << connected_.load();
}

TCP_Channel::~TCP_Channel() {
  close();
}

//==============================================
// CONNECTION ESTABLISHMENT
//==============================================

std::shared_ptr<TCP_Channel> TCP_Channel::connect(boost::asio::io_context& io_context,
                                                  const std::string& host, uint16_t port,
                                                  uint64_t max_frame_size) {
  BOOST_LOG_TRIVIAL(info) << "TCP channel: Connecting to " << host << ":" << port;

  try {
    boost::asio::ip::tcp::resolver resolver(io_context);
    auto endpoints = resolver.resolve(host, std::to_string(port));

    boost::asio::ip::tcp::socket socket(io_context);
    boost::asio::connect(socket, endpoints);

    BOOST_LOG_TRIVIAL(info) << "TCP channel: Connected to " << socket.remote_endpoint();
    return std::make_shared<TCP_Channel>(std::move(socket), max_frame_size);
  }
  catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP channel: Failed to connect to " << host << ":" << port << ": " << e.what();
    throw ChannelError(std::string("Failed to connect: ") + e.what());
  }
}

std::shared_ptr<TCP_Channel> TCP_Channel::accept(boost::asio::ip::tcp::acceptor& acceptor,
                                                 uint64_t max_frame_size) {
  BOOST_LOG_TRIVIAL(info) << "TCP channel: Waiting for peer on " << acceptor.local_endpoint();

  try {
    boost::asio::ip::tcp::socket socket(acceptor.get_executor());
    acceptor.accept(socket);

    BOOST_LOG_TRIVIAL(info) << "TCP channel: Accepted peer " << socket.remote_endpoint();
    return std::make_shared<TCP_Channel>(std::move(socket), max_frame_size);
  }
  catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP channel: Accept failed: " << e.what();
    throw ChannelError(std::string("Failed to accept: ") + e.what());
  }
}

//==============================================
// STREAM CONTROL OPERATIONS
//==============================================

bool TCP_Channel::start_reading() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);

  if (!connected_) {
    BOOST_LOG_TRIVIAL(error) << "TCP channel: Cannot start reading - socket not connected";
    return false;
  }

  if (reading_) {
    BOOST_LOG_TRIVIAL(debug) << "TCP channel: Reader already active";
    return true;
  }

  reading_ = true;
  reader_thread_ = std::make_unique<std::thread>(&TCP_Channel::read_loop, this);
  BOOST_LOG_TRIVIAL(info) << "TCP channel: Reader started";
  return true;
}

void TCP_Channel::close() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);

  connected_ = false;
  reading_ = false;

  boost::system::error_code ec;
  if (socket_.is_open()) {
    // Shutdown unblocks a reader waiting in read()
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
      BOOST_LOG_TRIVIAL(error) << "TCP channel: Socket shutdown error: " << ec.message();
    }
  }

  if (reader_thread_ && reader_thread_->joinable()) {
    if (reader_thread_->get_id() == std::this_thread::get_id()) {
      reader_thread_->detach();
    } else {
      reader_thread_->join();
    }
    reader_thread_.reset();
    BOOST_LOG_TRIVIAL(debug) << "TCP channel: Reader thread stopped";
  }

  if (socket_.is_open()) {
    socket_.close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "TCP channel: Socket close error: " << ec.message();
    }
    BOOST_LOG_TRIVIAL(info) << "TCP channel: Closed";
  }
}

//==============================================
// CHANNEL INTERFACE
//==============================================

bool TCP_Channel::is_connected() const {
  return connected_;
}

void TCP_Channel::send(const Frame& frame) {
  if (!connected_) {
    BOOST_LOG_TRIVIAL(error) << "TCP channel: Cannot send - socket not connected";
    throw ChannelError("Socket not connected");
  }

  if (frame.size() > max_frame_size_) {
    BOOST_LOG_TRIVIAL(error) << "TCP channel: Frame of " << frame.size() << " bytes exceeds limit " << max_frame_size_;
    throw ChannelError("Frame exceeds maximum size");
  }

  // Serializes writers only; the reader thread may be blocked in recv on the
  // same socket, which the send direction does not contend with
  std::lock_guard<std::mutex> lock(write_mutex_);

  uint64_t network_size = boost::endian::native_to_big(static_cast<uint64_t>(frame.size()));
  std::array<boost::asio::const_buffer, 2> buffers = {
    boost::asio::buffer(&network_size, sizeof(network_size)),
    boost::asio::buffer(frame)
  };

  boost::system::error_code ec;
  std::size_t bytes_written = boost::asio::write(socket_, buffers, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "TCP channel: Send error: " << ec.message();
    connected_ = false;
    throw ChannelError("Send failed: " + ec.message());
  }

  BOOST_LOG_TRIVIAL(debug) << "TCP channel: Sent " << bytes_written << " bytes";
}

//==============================================
// INCOMING DATA PROCESSING
//==============================================

void TCP_Channel::read_loop() {
  BOOST_LOG_TRIVIAL(debug) << "TCP channel: Read loop running";

  while (reading_) {
    Frame frame;
    if (!read_frame(frame)) {
      break;
    }
    deliver(frame);
  }

  connected_ = false;
  BOOST_LOG_TRIVIAL(info) << "TCP channel: Read loop finished";
}

bool TCP_Channel::read_frame(Frame& frame) {
  boost::system::error_code ec;

  uint64_t network_size = 0;
  boost::asio::read(socket_, boost::asio::buffer(&network_size, sizeof(network_size)), ec);
  if (ec) {
    if (ec == boost::asio::error::eof) {
      BOOST_LOG_TRIVIAL(info) << "TCP channel: Peer closed the connection";
    } else if (reading_) {
      BOOST_LOG_TRIVIAL(error) << "TCP channel: Size read error: " << ec.message();
    }
    return false;
  }

  uint64_t expected_size = boost::endian::big_to_native(network_size);
  if (expected_size > max_frame_size_) {
    BOOST_LOG_TRIVIAL(error) << "TCP channel: Inbound frame of " << expected_size
                             << " bytes exceeds limit " << max_frame_size_ << ", dropping connection";
    return false;
  }

  BOOST_LOG_TRIVIAL(debug) << "TCP channel: Expecting " << expected_size << " bytes of data";

  // Grow as bytes arrive so a declared size alone cannot force a large allocation
  frame.clear();
  while (frame.size() < expected_size) {
    const std::size_t offset = frame.size();
    const std::size_t chunk = static_cast<std::size_t>(
      std::min<uint64_t>(Codec::READ_CHUNK_SIZE, expected_size - offset));
    frame.resize(offset + chunk);
    boost::asio::read(socket_, boost::asio::buffer(frame.data() + offset, chunk), ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "TCP channel: Read error after " << offset << " of "
                               << expected_size << " bytes: " << ec.message();
      return false;
    }
  }

  return true;
}

} // namespace network
} // namespace sft
