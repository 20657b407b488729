#include "crypto/integrity_hasher.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace sft::crypto {

namespace {

// Frees the digest context on every exit path
struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

DigestContext begin_digest() {
  DigestContext ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error("Integrity hasher: Failed to create hash context");
  }
  if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
    throw std::runtime_error("Integrity hasher: Failed to initialize hash context");
  }
  return ctx;
}

void update_digest(EVP_MD_CTX* ctx, const void* data, size_t size) {
  if (!EVP_DigestUpdate(ctx, data, size)) {
    throw std::runtime_error("Integrity hasher: Failed to update hash");
  }
}

Digest finish_digest(EVP_MD_CTX* ctx) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(ctx, hash, &hash_len) || hash_len != DIGEST_SIZE) {
    throw std::runtime_error("Integrity hasher: Failed to finalize hash");
  }
  Digest result;
  std::copy(hash, hash + DIGEST_SIZE, result.begin());
  return result;
}

} // namespace

//==============================================
// DIGEST OPERATIONS
//==============================================

Digest IntegrityHasher::digest(const std::vector<uint8_t>& data) {
  BOOST_LOG_TRIVIAL(debug) << "Integrity hasher: Hashing " << data.size() << " bytes";

  auto ctx = begin_digest();
  update_digest(ctx.get(), data.data(), data.size());
  return finish_digest(ctx.get());
}

Digest IntegrityHasher::digest(std::istream& input) {
  auto ctx = begin_digest();

  char buffer[8192];
  size_t total_bytes = 0;

  // Read input stream in chunks and feed the digest
  while (input.read(buffer, sizeof(buffer))) {
    update_digest(ctx.get(), buffer, static_cast<size_t>(input.gcount()));
    total_bytes += input.gcount();
  }

  // Handle final partial chunk if present
  if (input.gcount() > 0) {
    update_digest(ctx.get(), buffer, static_cast<size_t>(input.gcount()));
    total_bytes += input.gcount();
  }

  if (input.bad()) {
    throw std::runtime_error("Integrity hasher: Failed to read from input stream");
  }

  BOOST_LOG_TRIVIAL(debug) << "Integrity hasher: Hashed " << total_bytes << " bytes from stream";
  return finish_digest(ctx.get());
}

//==============================================
// UTILITY METHODS
//==============================================

std::string IntegrityHasher::to_hex(const Digest& digest) {
  std::stringstream ss;
  for (auto byte : digest) {
    ss << std::hex << std::setw(2) << std::setfill('0') 
       << static_cast<int>(byte);
  }
  return ss.str();
}

} // namespace sft::crypto
