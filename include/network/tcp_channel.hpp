#ifndef SFT_NETWORK_TCP_CHANNEL_HPP
#define SFT_NETWORK_TCP_CHANNEL_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include "network/channel.hpp"
#include "network/codec.hpp"

namespace sft {
namespace network {

// Channel over one TCP connection. Each frame is a big-endian u64 length
// followed by the frame bytes.
//
// The reader thread and senders use blocking Asio calls on the same socket at
// the same time. This relies on the socket being full duplex: one recv and one
// send may be in progress concurrently on a POSIX stream socket. Senders are
// serialized by write_mutex_ and only the reader thread reads, so no two
// operations ever run in the same direction.
class TCP_Channel : public Channel {
public:
    // Delete copy operations to prevent socket duplication
    TCP_Channel(const TCP_Channel&) = delete;
    TCP_Channel& operator=(const TCP_Channel&) = delete;


    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit TCP_Channel(boost::asio::ip::tcp::socket socket,
                         uint64_t max_frame_size = Codec::DEFAULT_MAX_FRAME_SIZE);
    ~TCP_Channel() override;


    // ---- CONNECTION ESTABLISHMENT ----
    // Resolves and connects to a remote endpoint, throws ChannelError on failure
    static std::shared_ptr<TCP_Channel> connect(boost::asio::io_context& io_context,
                                                const std::string& host, uint16_t port,
                                                uint64_t max_frame_size = Codec::DEFAULT_MAX_FRAME_SIZE);
    // Blocks until one peer connects on the acceptor
    static std::shared_ptr<TCP_Channel> accept(boost::asio::ip::tcp::acceptor& acceptor,
                                               uint64_t max_frame_size = Codec::DEFAULT_MAX_FRAME_SIZE);


    // ---- STREAM CONTROL OPERATIONS ----
    // Starts the reader thread that delivers inbound frames
    bool start_reading();
    void close();


    // ---- CHANNEL INTERFACE ----
    bool is_connected() const override;
    void send(const Frame& frame) override;

private:
    // ---- PARAMETERS ----
    boost::asio::ip::tcp::socket socket_;
    uint64_t max_frame_size_;
    std::mutex write_mutex_;        // one writer at a time, reads never take it
    std::mutex lifecycle_mutex_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> reading_{false};
    std::unique_ptr<std::thread> reader_thread_;


    // ---- INCOMING DATA PROCESSING ----
    void read_loop();
    // Returns false on orderly shutdown or read error
    bool read_frame(Frame& frame);
};

} // namespace network
} // namespace sft

#endif // SFT_NETWORK_TCP_CHANNEL_HPP
