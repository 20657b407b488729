#ifndef SFT_NETWORK_LOOPBACK_CHANNEL_HPP
#define SFT_NETWORK_LOOPBACK_CHANNEL_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <utility>
#include "network/channel.hpp"

namespace sft {
namespace network {

// In-process channel: frames sent on one end are delivered to the other end
// synchronously on the sending thread.
class LoopbackChannel : public Channel {
public:
    using Pair = std::pair<std::shared_ptr<LoopbackChannel>, std::shared_ptr<LoopbackChannel>>;

    // Creates two connected ends
    static Pair create_pair();

    LoopbackChannel() = default;
    ~LoopbackChannel() override;

    bool is_connected() const override;
    void send(const Frame& frame) override;

    // Disconnects both ends
    void close();

    std::size_t frames_sent() const { return frames_sent_; }

private:
    mutable std::mutex mutex_;
    std::weak_ptr<LoopbackChannel> peer_;
    std::atomic<bool> open_{false};
    std::atomic<std::size_t> frames_sent_{0};

    void receive(const Frame& frame);
    void mark_closed();
};

} // namespace network
} // namespace sft

#endif // SFT_NETWORK_LOOPBACK_CHANNEL_HPP
