#include "network/channel.hpp"
#include <boost/log/trivial.hpp>
#include <utility>

namespace sft {
namespace network {

//==============================================
// SUBSCRIPTION
//==============================================

Subscription::Subscription(std::weak_ptr<HandlerRegistry> registry, uint64_t id)
    : registry_(std::move(registry))
    , id_(id) {
}

Subscription::~Subscription() {
    reset();
}

Subscription::Subscription(Subscription&& other) noexcept
    : registry_(std::move(other.registry_))
    , id_(std::exchange(other.id_, 0)) {
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        registry_ = std::move(other.registry_);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

void Subscription::reset() {
    if (id_ == 0) {
        return;
    }
    // The channel may already be gone
    if (auto registry = registry_.lock()) {
        registry->remove(id_);
    }
    registry_.reset();
    id_ = 0;
}

bool Subscription::active() const {
    auto registry = registry_.lock();
    return registry && registry->contains(id_);
}

//==============================================
// HANDLER REGISTRY
//==============================================

uint64_t HandlerRegistry::add(FrameHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    handlers_.emplace(id, std::move(handler));
    BOOST_LOG_TRIVIAL(debug) << "Channel: Registered handler " << id << ". Handler count: " << handlers_.size();
    return id;
}

void HandlerRegistry::remove(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handlers_.erase(id) > 0) {
        BOOST_LOG_TRIVIAL(debug) << "Channel: Removed handler " << id << ". Handler count: " << handlers_.size();
    }
}

bool HandlerRegistry::contains(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(id) > 0;
}

std::size_t HandlerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

void HandlerRegistry::dispatch(const Frame& frame) const {
    std::vector<FrameHandler> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(handlers_.size());
        for (const auto& entry : handlers_) {
            snapshot.push_back(entry.second);
        }
    }

    if (snapshot.empty()) {
        BOOST_LOG_TRIVIAL(warning) << "Channel: Dropping frame of " << frame.size() << " bytes, no handler registered";
        return;
    }

    for (const auto& handler : snapshot) {
        try {
            handler(frame);
        } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(error) << "Channel: Frame handler error: " << e.what();
        }
    }
}

//==============================================
// CHANNEL
//==============================================

Channel::Channel()
    : registry_(std::make_shared<HandlerRegistry>()) {
}

Subscription Channel::subscribe(FrameHandler handler) {
    uint64_t id = registry_->add(std::move(handler));
    return Subscription(registry_, id);
}

void Channel::deliver(const Frame& frame) const {
    BOOST_LOG_TRIVIAL(trace) << "Channel: Delivering inbound frame of " << frame.size() << " bytes";
    registry_->dispatch(frame);
}

} // namespace network
} // namespace sft
