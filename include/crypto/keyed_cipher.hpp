#ifndef SFT_CRYPTO_KEYED_CIPHER_HPP
#define SFT_CRYPTO_KEYED_CIPHER_HPP

#include <cstdint>
#include <cstddef>
#include <vector>
#include <memory>
#include "crypto_error.hpp"

namespace sft::crypto {

using Bytes = std::vector<uint8_t>;
using SymmetricKey = std::vector<uint8_t>;

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// AES-256-GCM over whole in-memory payloads.
// Ciphertext layout: nonce || encrypted bytes || tag
class KeyedCipher {
public:
  static constexpr size_t KEY_SIZE = 32;     // 256 bits for AES-256
  static constexpr size_t NONCE_SIZE = 12;   // 96 bits recommended for GCM
  static constexpr size_t TAG_SIZE = 16;     // 128-bit authentication tag
  static constexpr size_t OVERHEAD = NONCE_SIZE + TAG_SIZE;
  static constexpr size_t DEFAULT_MAX_PLAINTEXT_SIZE = size_t{2} * 1024 * 1024 * 1024; // 2GB

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit KeyedCipher(size_t max_plaintext_size = DEFAULT_MAX_PLAINTEXT_SIZE);
  ~KeyedCipher();

  KeyedCipher(const KeyedCipher&) = delete;
  KeyedCipher& operator=(const KeyedCipher&) = delete;


  // ---- KEY GENERATION ----
  // Returns KEY_SIZE bytes from the OpenSSL CSPRNG
  SymmetricKey generate_key() const;


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  Bytes encrypt(const Bytes& plaintext, const SymmetricKey& key);
  // Throws AuthenticationError unless the tag authenticates under key
  Bytes decrypt(const Bytes& ciphertext, const SymmetricKey& key);


  // ---- GETTERS ----
  size_t max_plaintext_size() const { return max_plaintext_size_; }
  static constexpr size_t overhead() { return OVERHEAD; }

private:
  // ---- PARAMETERS ----
  size_t max_plaintext_size_;
  std::unique_ptr<CipherContext> context_;


  // ---- HELPERS ----
  // Checks the key length before any cipher setup
  static void validate_key(const SymmetricKey& key);
  // Fills a fresh nonce for each encryption
  static void generate_nonce(uint8_t* nonce);
};

} // namespace sft::crypto

#endif // SFT_CRYPTO_KEYED_CIPHER_HPP
