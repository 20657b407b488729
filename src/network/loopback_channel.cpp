#include "network/loopback_channel.hpp"
#include "network/network_error.hpp"
#include <boost/log/trivial.hpp>

namespace sft {
namespace network {

LoopbackChannel::Pair LoopbackChannel::create_pair() {
    auto first = std::make_shared<LoopbackChannel>();
    auto second = std::make_shared<LoopbackChannel>();

    first->peer_ = second;
    second->peer_ = first;
    first->open_ = true;
    second->open_ = true;

    BOOST_LOG_TRIVIAL(debug) << "Loopback channel: Created connected pair";
    return {first, second};
}

LoopbackChannel::~LoopbackChannel() {
    close();
}

bool LoopbackChannel::is_connected() const {
    if (!open_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return !peer_.expired();
}

void LoopbackChannel::send(const Frame& frame) {
    std::shared_ptr<LoopbackChannel> peer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        peer = peer_.lock();
    }

    if (!open_ || !peer || !peer->open_) {
        BOOST_LOG_TRIVIAL(error) << "Loopback channel: Cannot send - peer not connected";
        throw ChannelError("Peer not connected");
    }

    ++frames_sent_;
    BOOST_LOG_TRIVIAL(debug) << "Loopback channel: Sending frame of " << frame.size() << " bytes";
    peer->receive(frame);
}

void LoopbackChannel::receive(const Frame& frame) {
    // Each end gets its own copy of the frame
    Frame copy = frame;
    deliver(copy);
}

void LoopbackChannel::close() {
    std::shared_ptr<LoopbackChannel> peer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        peer = peer_.lock();
        peer_.reset();
    }
    mark_closed();
    if (peer) {
        peer->mark_closed();
    }
}

void LoopbackChannel::mark_closed() {
    if (open_.exchange(false)) {
        BOOST_LOG_TRIVIAL(info) << "Loopback channel: Closed";
    }
}

} // namespace network
} // namespace sft
