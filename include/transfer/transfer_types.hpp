#ifndef SFT_TRANSFER_TYPES_HPP
#define SFT_TRANSFER_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "crypto/keyed_cipher.hpp"
#include "network/codec.hpp"

namespace sft {
namespace transfer {

// File chosen by the user, held until a send succeeds or another file replaces it
struct PendingFile {
    std::string name;
    std::string mime_type;
    std::vector<uint8_t> contents;
};

// Verified plaintext handed to the consumer
struct ReceivedFile {
    std::string name;
    std::string mime_type;
    uint64_t size = 0;
    std::vector<uint8_t> contents;
};

struct TransferConfig {
    // Largest plaintext accepted for sending or receiving
    std::size_t max_payload_size = crypto::KeyedCipher::DEFAULT_MAX_PLAINTEXT_SIZE;

    // Wire frames carry the ciphertext plus metadata
    uint64_t max_frame_size() const {
        return static_cast<uint64_t>(max_payload_size) + crypto::KeyedCipher::OVERHEAD + 2 * network::Codec::MAX_TEXT_FIELD + 256;
    }
};

} // namespace transfer
} // namespace sft

#endif // SFT_TRANSFER_TYPES_HPP
