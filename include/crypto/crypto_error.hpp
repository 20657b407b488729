#ifndef SFT_CRYPTO_ERROR_HPP
#define SFT_CRYPTO_ERROR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace sft::crypto {

// Base of every failure raised by KeyedCipher
class CipherError : public std::runtime_error {
public:
    explicit CipherError(const std::string& message)
        : std::runtime_error(message) {}
};

// OpenSSL could not provide a context or random bytes
class InitializationError : public CipherError {
public:
    explicit InitializationError(const std::string& message)
        : CipherError("Initialization error: " + message) {}
};

// Key length does not match AES-256, typically a malformed envelope
class KeySizeError : public CipherError {
public:
    KeySizeError(std::size_t actual, std::size_t expected)
        : CipherError("Invalid key size: " + std::to_string(actual) +
                      " bytes, expected " + std::to_string(expected))
        , actual_(actual)
        , expected_(expected) {}

    std::size_t actual() const { return actual_; }
    std::size_t expected() const { return expected_; }

private:
    std::size_t actual_;
    std::size_t expected_;
};

class EncryptionError : public CipherError {
public:
    explicit EncryptionError(const std::string& message)
        : CipherError("Encryption error: " + message) {}
};

class DecryptionError : public CipherError {
public:
    explicit DecryptionError(const std::string& message)
        : CipherError("Decryption error: " + message) {}
};

// GCM tag rejected: wrong key, or nonce, ciphertext or tag modified in transit
class AuthenticationError : public DecryptionError {
public:
    AuthenticationError()
        : DecryptionError("Authentication failed") {}
};

} // namespace sft::crypto

#endif // SFT_CRYPTO_ERROR_HPP
