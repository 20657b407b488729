#ifndef SFT_TRANSFER_ERROR_HPP
#define SFT_TRANSFER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace sft {
namespace transfer {

// Digest of the decrypted plaintext differs from the digest in the envelope
class IntegrityError : public std::runtime_error {
public:
    explicit IntegrityError(const std::string& message) 
        : std::runtime_error(message) {}
};

} // namespace transfer
} // namespace sft

#endif // SFT_TRANSFER_ERROR_HPP
