#ifndef SFT_CRYPTO_INTEGRITY_HASHER_HPP
#define SFT_CRYPTO_INTEGRITY_HASHER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace sft::crypto {

constexpr std::size_t DIGEST_SIZE = 32;  // SHA-256

using Digest = std::array<uint8_t, DIGEST_SIZE>;

class IntegrityHasher {
public:
  // ---- DIGEST OPERATIONS ----
  // SHA-256 over the given bytes, nothing else is mixed in
  static Digest digest(const std::vector<uint8_t>& data);
  // Reads the stream to EOF in chunks
  static Digest digest(std::istream& input);


  // ---- UTILITY METHODS ----
  static std::string to_hex(const Digest& digest);
};

} // namespace sft::crypto

#endif // SFT_CRYPTO_INTEGRITY_HASHER_HPP
