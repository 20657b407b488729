#ifndef SFT_NETWORK_CHANNEL_HPP
#define SFT_NETWORK_CHANNEL_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace sft {
namespace network {

using Frame = std::vector<uint8_t>;
using FrameHandler = std::function<void(const Frame&)>;

class HandlerRegistry;

// Scoped registration of an inbound handler. Deregisters on destruction or reset().
class Subscription {
public:
    Subscription() = default;
    Subscription(std::weak_ptr<HandlerRegistry> registry, uint64_t id);
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    void reset();
    bool active() const;

private:
    std::weak_ptr<HandlerRegistry> registry_;
    uint64_t id_ = 0;
};

// Handlers shared between a channel and its subscriptions
class HandlerRegistry {
public:
    uint64_t add(FrameHandler handler);
    void remove(uint64_t id);
    bool contains(uint64_t id) const;
    std::size_t size() const;
    // Invokes every handler with a snapshot taken outside the lock
    void dispatch(const Frame& frame) const;

private:
    mutable std::mutex mutex_;
    std::map<uint64_t, FrameHandler> handlers_;
    uint64_t next_id_ = 1;
};

// Bidirectional frame transport to one peer
class Channel {
public:
    virtual ~Channel() = default;

    
    // ---- CONNECTION STATE ----
    virtual bool is_connected() const = 0;

    
    // ---- OUTGOING FRAMES ----
    // Best-effort delivery, throws ChannelError when the peer is unreachable
    virtual void send(const Frame& frame) = 0;

    
    // ---- INCOMING FRAMES ----
    Subscription subscribe(FrameHandler handler);
    std::size_t subscriber_count() const { return registry_->size(); }

protected:
    Channel();

    // Called by implementations for every inbound frame
    void deliver(const Frame& frame) const;

private:
    std::shared_ptr<HandlerRegistry> registry_;
};

} // namespace network
} // namespace sft

#endif // SFT_NETWORK_CHANNEL_HPP
