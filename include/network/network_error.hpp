#ifndef SFT_NETWORK_ERROR_HPP
#define SFT_NETWORK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace sft {
namespace network {

// Underlying transport could not deliver a frame
class ChannelError : public std::runtime_error {
public:
    explicit ChannelError(const std::string& message) 
        : std::runtime_error("Channel error: " + message) {}
};

// Inbound frame does not match the wire format
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message) 
        : std::runtime_error("Protocol error: " + message) {}
};

} // namespace network
} // namespace sft

#endif // SFT_NETWORK_ERROR_HPP
