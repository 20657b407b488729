#ifndef SFT_NETWORK_MESSAGE_HPP
#define SFT_NETWORK_MESSAGE_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include "crypto/integrity_hasher.hpp"
#include "crypto/keyed_cipher.hpp"

namespace sft {
namespace network {

// Type tag of the only message this protocol acts on
inline constexpr const char* FILE_INCOMING_TYPE = "file-incoming";

// Envelope for one file: metadata, key, digest of the plaintext and the ciphertext
struct FileData {
    std::string name;
    std::string mime_type;
    uint64_t size = 0;
    crypto::SymmetricKey key;
    crypto::Digest hash{};
    std::vector<uint8_t> data;
};

struct FileIncoming {
    FileData file_data;
};

// Any other type multiplexed on the same channel, kept by tag only
struct Unrecognized {
    std::string type;
};

using Message = std::variant<FileIncoming, Unrecognized>;

// Returns the wire type tag of a message
inline std::string message_type(const Message& message) {
    if (const auto* other = std::get_if<Unrecognized>(&message)) {
        return other->type;
    }
    return FILE_INCOMING_TYPE;
}

} // namespace network
} // namespace sft

#endif // SFT_NETWORK_MESSAGE_HPP
