#include "crypto/keyed_cipher.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <limits>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace sft::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw InitializationError("Keyed cipher: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  EVP_CIPHER_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

KeyedCipher::KeyedCipher(size_t max_plaintext_size)
  : max_plaintext_size_(max_plaintext_size)
  , context_(std::make_unique<CipherContext>()) {
  // EVP_EncryptUpdate takes an int length
  if (max_plaintext_size_ > static_cast<size_t>(std::numeric_limits<int>::max())) {
    max_plaintext_size_ = static_cast<size_t>(std::numeric_limits<int>::max());
  }
  BOOST_LOG_TRIVIAL(debug) << "Keyed cipher: Initialized with max plaintext size " << max_plaintext_size_;
}

KeyedCipher::~KeyedCipher() = default;

//==============================================
// KEY GENERATION
//==============================================

SymmetricKey KeyedCipher::generate_key() const {
  SymmetricKey key(KEY_SIZE);
  if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
    throw InitializationError("Keyed cipher: Failed to generate random key");
  }
  BOOST_LOG_TRIVIAL(debug) << "Keyed cipher: Generated fresh " << KEY_SIZE * 8 << "-bit key";
  return key;
}

void KeyedCipher::generate_nonce(uint8_t* nonce) {
  if (RAND_bytes(nonce, static_cast<int>(NONCE_SIZE)) != 1) {
    throw EncryptionError("Keyed cipher: Failed to generate random nonce");
  }
}

void KeyedCipher::validate_key(const SymmetricKey& key) {
  if (key.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Keyed cipher: Invalid key size: " << key.size() << " bytes (expected " << KEY_SIZE << " bytes)";
    throw KeySizeError(key.size(), KEY_SIZE);
  }
}

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

Bytes KeyedCipher::encrypt(const Bytes& plaintext, const SymmetricKey& key) {
  validate_key(key);

  if (plaintext.size() > max_plaintext_size_) {
    BOOST_LOG_TRIVIAL(error) << "Keyed cipher: Plaintext of " << plaintext.size()
                             << " bytes exceeds limit of " << max_plaintext_size_;
    throw EncryptionError("Plaintext exceeds maximum size");
  }

  BOOST_LOG_TRIVIAL(debug) << "Keyed cipher: Encrypting " << plaintext.size() << " bytes";

  Bytes output(NONCE_SIZE + plaintext.size() + TAG_SIZE);
  uint8_t* nonce = output.data();
  uint8_t* body = output.data() + NONCE_SIZE;
  uint8_t* tag = body + plaintext.size();
  generate_nonce(nonce);

  EVP_CIPHER_CTX* ctx = context_->get();
  EVP_CIPHER_CTX_reset(ctx);

  if (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
    throw EncryptionError("Failed to initialize encryption context");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1) {
    throw EncryptionError("Failed to set nonce length");
  }
  if (EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce) != 1) {
    throw EncryptionError("Failed to set key and nonce");
  }

  int outlen = 0;
  if (!plaintext.empty()) {
    if (EVP_EncryptUpdate(ctx, body, &outlen, plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
      throw EncryptionError("Failed to encrypt data");
    }
  }

  int final_len = 0;
  if (EVP_EncryptFinal_ex(ctx, body + outlen, &final_len) != 1) {
    throw EncryptionError("Failed to finalize encryption");
  }

  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), tag) != 1) {
    throw EncryptionError("Failed to read authentication tag");
  }

  BOOST_LOG_TRIVIAL(debug) << "Keyed cipher: Produced " << output.size() << " bytes of ciphertext";
  return output;
}

Bytes KeyedCipher::decrypt(const Bytes& ciphertext, const SymmetricKey& key) {
  validate_key(key);

  if (ciphertext.size() < OVERHEAD) {
    BOOST_LOG_TRIVIAL(error) << "Keyed cipher: Ciphertext too short: " << ciphertext.size() << " bytes";
    throw DecryptionError("Ciphertext truncated");
  }

  const size_t body_size = ciphertext.size() - OVERHEAD;
  if (body_size > max_plaintext_size_) {
    throw DecryptionError("Ciphertext exceeds maximum size");
  }

  BOOST_LOG_TRIVIAL(debug) << "Keyed cipher: Decrypting " << body_size << " bytes";

  const uint8_t* nonce = ciphertext.data();
  const uint8_t* body = ciphertext.data() + NONCE_SIZE;
  const uint8_t* tag = body + body_size;

  EVP_CIPHER_CTX* ctx = context_->get();
  EVP_CIPHER_CTX_reset(ctx);

  if (EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
    throw DecryptionError("Failed to initialize decryption context");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1) {
    throw DecryptionError("Failed to set nonce length");
  }
  if (EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce) != 1) {
    throw DecryptionError("Failed to set key and nonce");
  }

  Bytes plaintext(body_size);
  int outlen = 0;
  if (body_size > 0) {
    if (EVP_DecryptUpdate(ctx, plaintext.data(), &outlen, body, static_cast<int>(body_size)) != 1) {
      throw DecryptionError("Failed to decrypt data");
    }
  }

  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE),
                          const_cast<uint8_t*>(tag)) != 1) {
    throw DecryptionError("Failed to set authentication tag");
  }

  int final_len = 0;
  if (EVP_DecryptFinal_ex(ctx, plaintext.data() + outlen, &final_len) != 1) {
    ERR_clear_error();
    BOOST_LOG_TRIVIAL(warning) << "Keyed cipher: Authentication failed, discarding output";
    throw AuthenticationError();
  }

  return plaintext;
}

} // namespace sft::crypto
