#pragma once
// Crypto module: RSA-2048 key pairs, AES-256-GCM, RSA PKCS#1 v1.5 and the
// hybrid scheme built from them.
//
// Hybrid: a fresh 256-bit AES key and 96-bit nonce per message encrypt the
// body (ciphertext || 16-byte tag); the AES key is wrapped with the
// recipient's RSA public key. Legacy: the body is RSA-encrypted directly and
// is limited to modulus_bytes - 11 bytes.
#include <cstdint>
#include <functional>
#include <openssl/evp.h>
#include <string>
#include <vector>

#define AES_KEY_SIZE 32
#define GCM_NONCE_SIZE 12
#define GCM_TAG_SIZE 16
#define RSA_KEY_BITS 2048
// PKCS#1 v1.5 encryption padding overhead in bytes.
#define PKCS1_PADDING_OVERHEAD 11

// Fills `len` bytes at `out`. Injected so tests can pin keys and nonces.
using RandomSource = std::function<void(uint8_t* out, size_t len)>;

// Default random source: OpenSSL RAND_bytes. Throws on RNG failure.
void openssl_random(uint8_t* out, size_t len);

// Owning handle to an RSA EVP_PKEY, public-only or full key pair.
// Move-only; immutable after construction so it can be shared for reads.
class RsaKey {
  EVP_PKEY* pkey;
  bool private_part;

public:
  RsaKey();
  RsaKey(EVP_PKEY* owned, bool has_private);
  RsaKey(RsaKey&& other) noexcept;
  RsaKey& operator=(RsaKey&& other) noexcept;
  RsaKey(const RsaKey&) = delete;
  RsaKey& operator=(const RsaKey&) = delete;
  ~RsaKey();

  bool empty() const {
    return pkey == nullptr;
  }
  bool has_private() const {
    return private_part;
  }
  EVP_PKEY* get() const {
    return pkey;
  }
  int bits() const;
  // Size of an RSA block (modulus) in bytes.
  size_t modulus_bytes() const;
  // Largest plaintext a single PKCS#1 v1.5 block can carry.
  size_t max_legacy_plaintext() const {
    return modulus_bytes() - PKCS1_PADDING_OVERHEAD;
  }

  // PEM SubjectPublicKeyInfo ("-----BEGIN PUBLIC KEY-----").
  std::string public_pem() const;
  // PEM PKCS#8, unencrypted. Throws INVALID_KEY on a public-only key.
  std::string private_pem() const;
  // Public half only, for handing to senders.
  RsaKey public_only() const;

  static RsaKey from_public_pem(const std::string& pem);
  static RsaKey from_private_pem(const std::string& pem);
  static RsaKey load_public_pem_file(const std::string& path);
  static RsaKey load_private_pem_file(const std::string& path);
  void save_public_pem_file(const std::string& path) const;
  void save_private_pem_file(const std::string& path) const;
};

// RSA key pair, public exponent 65537.
RsaKey generate_rsa_keypair(int bits = RSA_KEY_BITS);

// Standard base64 with padding, no line breaks.
std::string base64_encode(const uint8_t* data, size_t len);
std::string base64_encode(const std::vector<uint8_t>& data);
// Strict decode; false on bad length, characters or non-zero trailing bits.
bool base64_decode(const std::string& text, std::vector<uint8_t>& out);

// AES-256-GCM without associated data. Output: [ciphertext][16-byte tag].
std::vector<uint8_t> aes_gcm_encrypt(const std::string& plaintext, const uint8_t key[AES_KEY_SIZE], const uint8_t nonce[GCM_NONCE_SIZE]);

// Input: [ciphertext][16-byte tag]. Throws AUTHENTICATION_FAILED when the tag
// does not verify.
std::string aes_gcm_decrypt(const std::vector<uint8_t>& sealed, const uint8_t key[AES_KEY_SIZE], const uint8_t nonce[GCM_NONCE_SIZE]);

// RSA PKCS#1 v1.5. Encrypt throws PLAINTEXT_TOO_LARGE past the block limit;
// decrypt throws KEY_UNWRAP_FAILED on any failure, without detail. Implicit
// rejection is turned off where OpenSSL supports it, so bad padding always
// throws instead of yielding synthetic plaintext.
std::vector<uint8_t> rsa_encrypt_pkcs1(const RsaKey& public_key, const uint8_t* data, size_t len);
std::vector<uint8_t> rsa_decrypt_pkcs1(const RsaKey& private_key, const std::vector<uint8_t>& ciphertext);

// Base64 fields of an encrypted body. `hybrid` is false for the legacy form,
// in which case `secure_key` and `iv` are empty.
struct SecureFields {
  std::string secure_key;
  std::string iv;
  std::string secure_payload;
  bool hybrid = false;
};

SecureFields hybrid_encrypt(const std::string& plaintext, const RsaKey& recipient, const RandomSource& random = openssl_random);

SecureFields legacy_encrypt(const std::string& plaintext, const RsaKey& recipient);

// Dispatches on `fields.hybrid`. Throws KEY_UNWRAP_FAILED or
// AUTHENTICATION_FAILED; never returns unauthenticated plaintext on the
// hybrid path.
std::string decrypt_fields(const SecureFields& fields, const RsaKey& private_key);
