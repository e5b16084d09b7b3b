#include "crypto.hpp"
#include "errors.hpp"
#include <cstring>
#include <fstream>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/params.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <sstream>

void openssl_random(uint8_t* out, size_t len) {
  if (RAND_bytes(out, static_cast<int>(len)) != 1) {
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "RAND_bytes failed");
  }
}

/* ============================================================
 *                        RsaKey
 * ============================================================ */

RsaKey::RsaKey() : pkey(nullptr), private_part(false) {}

RsaKey::RsaKey(EVP_PKEY* owned, bool has_private) : pkey(owned), private_part(has_private) {}

RsaKey::RsaKey(RsaKey&& other) noexcept : pkey(other.pkey), private_part(other.private_part) {
  other.pkey = nullptr;
  other.private_part = false;
}

RsaKey& RsaKey::operator=(RsaKey&& other) noexcept {
  if (this != &other) {
    EVP_PKEY_free(pkey);
    pkey = other.pkey;
    private_part = other.private_part;
    other.pkey = nullptr;
    other.private_part = false;
  }
  return *this;
}

RsaKey::~RsaKey() {
  EVP_PKEY_free(pkey);
}

int RsaKey::bits() const {
  return pkey ? EVP_PKEY_bits(pkey) : 0;
}

size_t RsaKey::modulus_bytes() const {
  return pkey ? static_cast<size_t>(EVP_PKEY_size(pkey)) : 0;
}

static std::string drain_bio(BIO* bio) {
  char* data = nullptr;
  long len = BIO_get_mem_data(bio, &data);
  std::string out(data, static_cast<size_t>(len));
  BIO_free(bio);
  return out;
}

std::string RsaKey::public_pem() const {
  if (!pkey) {
    throw IpcError(ErrorCode::INVALID_KEY, "empty key");
  }
  BIO* bio = BIO_new(BIO_s_mem());
  if (!bio) {
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "BIO_new failed");
  }
  if (PEM_write_bio_PUBKEY(bio, pkey) != 1) {
    BIO_free(bio);
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "PEM_write_bio_PUBKEY failed");
  }
  return drain_bio(bio);
}

std::string RsaKey::private_pem() const {
  if (!pkey || !private_part) {
    throw IpcError(ErrorCode::INVALID_KEY, "key has no private part");
  }
  BIO* bio = BIO_new(BIO_s_mem());
  if (!bio) {
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "BIO_new failed");
  }
  if (PEM_write_bio_PrivateKey(bio, pkey, nullptr, nullptr, 0, nullptr, nullptr) != 1) {
    BIO_free(bio);
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "PEM_write_bio_PrivateKey failed");
  }
  return drain_bio(bio);
}

RsaKey RsaKey::public_only() const {
  return from_public_pem(public_pem());
}

static EVP_PKEY* read_pem(const std::string& pem, bool want_private) {
  BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
  if (!bio) {
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "BIO_new_mem_buf failed");
  }
  EVP_PKEY* key = want_private ? PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr) : PEM_read_bio_PUBKEY(bio, nullptr, nullptr, nullptr);
  BIO_free(bio);
  if (!key) {
    ERR_clear_error();
    throw IpcError(ErrorCode::INVALID_KEY, want_private ? "could not parse private key PEM" : "could not parse public key PEM");
  }
  if (EVP_PKEY_base_id(key) != EVP_PKEY_RSA) {
    EVP_PKEY_free(key);
    throw IpcError(ErrorCode::INVALID_KEY, "PEM does not hold an RSA key");
  }
  return key;
}

RsaKey RsaKey::from_public_pem(const std::string& pem) {
  return RsaKey(read_pem(pem, false), false);
}

RsaKey RsaKey::from_private_pem(const std::string& pem) {
  return RsaKey(read_pem(pem, true), true);
}

static std::string read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw IpcError(ErrorCode::INVALID_KEY, "cannot open key file " + path);
  }
  std::ostringstream oss;
  oss << in.rdbuf();
  return oss.str();
}

static void write_file(const std::string& path, const std::string& contents) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw IpcError(ErrorCode::INVALID_KEY, "cannot write key file " + path);
  }
  out << contents;
  if (!out) {
    throw IpcError(ErrorCode::INVALID_KEY, "short write to key file " + path);
  }
}

RsaKey RsaKey::load_public_pem_file(const std::string& path) {
  return from_public_pem(read_file(path));
}

RsaKey RsaKey::load_private_pem_file(const std::string& path) {
  return from_private_pem(read_file(path));
}

void RsaKey::save_public_pem_file(const std::string& path) const {
  write_file(path, public_pem());
}

void RsaKey::save_private_pem_file(const std::string& path) const {
  write_file(path, private_pem());
}

RsaKey generate_rsa_keypair(int bits) {
  EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
  if (!ctx) {
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "Failed to create EVP_PKEY_CTX");
  }

  if (EVP_PKEY_keygen_init(ctx) <= 0) {
    EVP_PKEY_CTX_free(ctx);
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "keygen_init");
  }

  if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, bits) <= 0) {
    EVP_PKEY_CTX_free(ctx);
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "set_rsa_keygen_bits");
  }

  BIGNUM* exponent = BN_new();
  if (!exponent || BN_set_word(exponent, RSA_F4) != 1 || EVP_PKEY_CTX_set1_rsa_keygen_pubexp(ctx, exponent) <= 0) {
    BN_free(exponent);
    EVP_PKEY_CTX_free(ctx);
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "set_rsa_keygen_pubexp");
  }
  BN_free(exponent);

  EVP_PKEY* pkey = nullptr;
  if (EVP_PKEY_keygen(ctx, &pkey) <= 0) {
    EVP_PKEY_CTX_free(ctx);
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "keygen");
  }

  EVP_PKEY_CTX_free(ctx);
  return RsaKey(pkey, true);
}

/* ============================================================
 *                        Base64
 * ============================================================ */

std::string base64_encode(const uint8_t* data, size_t len) {
  std::string out(4 * ((len + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(len));
  out.resize(static_cast<size_t>(written));
  return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
  return base64_encode(data.data(), data.size());
}

// 6-bit value of a base64 character, or -1.
static int base64_value(char c) {
  if (c >= 'A' && c <= 'Z')
    return c - 'A';
  if (c >= 'a' && c <= 'z')
    return c - 'a' + 26;
  if (c >= '0' && c <= '9')
    return c - '0' + 52;
  if (c == '+')
    return 62;
  if (c == '/')
    return 63;
  return -1;
}

bool base64_decode(const std::string& text, std::vector<uint8_t>& out) {
  out.clear();
  if (text.empty())
    return true;
  if (text.size() % 4 != 0)
    return false;

  size_t padding = 0;
  if (text[text.size() - 1] == '=') {
    ++padding;
    if (text[text.size() - 2] == '=')
      ++padding;
  }
  for (size_t i = 0; i < text.size() - padding; ++i) {
    if (base64_value(text[i]) < 0)
      return false;
  }
  // Bits below the last encoded byte must be zero, so each byte string has
  // exactly one encoding.
  if (padding == 1 && (base64_value(text[text.size() - 2]) & 0x03) != 0)
    return false;
  if (padding == 2 && (base64_value(text[text.size() - 3]) & 0x0F) != 0)
    return false;

  out.resize(text.size() / 4 * 3);
  int decoded = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()), static_cast<int>(text.size()));
  if (decoded < 0) {
    out.clear();
    return false;
  }
  // EVP_DecodeBlock counts the padding as zero bytes.
  out.resize(static_cast<size_t>(decoded) - padding);
  return true;
}

/* ============================================================
 *                        AES-256-GCM
 * ============================================================ */

std::vector<uint8_t> aes_gcm_encrypt(const std::string& plaintext, const uint8_t key[AES_KEY_SIZE], const uint8_t nonce[GCM_NONCE_SIZE]) {
  EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
  if (!ctx) {
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "Failed to create EVP_CIPHER_CTX");
  }

  if (EVP_EncryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, key, nonce) != 1) {
    EVP_CIPHER_CTX_free(ctx);
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "Failed to init AES-256-GCM");
  }

  // Result format: [ciphertext][16 bytes tag]
  std::vector<uint8_t> result(plaintext.size() + GCM_TAG_SIZE);

  int len = 0;
  if (EVP_EncryptUpdate(ctx, result.data(), &len, reinterpret_cast<const uint8_t*>(plaintext.data()), static_cast<int>(plaintext.size())) != 1) {
    EVP_CIPHER_CTX_free(ctx);
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "Encryption failed");
  }
  int final_len = 0;
  if (EVP_EncryptFinal_ex(ctx, result.data() + len, &final_len) != 1) {
    EVP_CIPHER_CTX_free(ctx);
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "Final encryption step failed");
  }

  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_GET_TAG, GCM_TAG_SIZE, result.data() + len + final_len) != 1) {
    EVP_CIPHER_CTX_free(ctx);
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "Failed to get GCM tag");
  }

  EVP_CIPHER_CTX_free(ctx);
  result.resize(len + final_len + GCM_TAG_SIZE);
  return result;
}

std::string aes_gcm_decrypt(const std::vector<uint8_t>& sealed, const uint8_t key[AES_KEY_SIZE], const uint8_t nonce[GCM_NONCE_SIZE]) {
  if (sealed.size() < GCM_TAG_SIZE) {
    throw IpcError(ErrorCode::AUTHENTICATION_FAILED, "ciphertext shorter than tag");
  }

  const uint8_t* encrypted_data = sealed.data();
  size_t encrypted_len = sealed.size() - GCM_TAG_SIZE;
  const uint8_t* tag = sealed.data() + encrypted_len;

  EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
  if (!ctx) {
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "Failed to create EVP_CIPHER_CTX");
  }

  if (EVP_DecryptInit_ex(ctx, EVP_aes_256_gcm(), nullptr, key, nonce) != 1) {
    EVP_CIPHER_CTX_free(ctx);
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "Failed to init AES-256-GCM");
  }

  std::vector<uint8_t> plaintext(encrypted_len + 1);
  int len = 0;
  if (EVP_DecryptUpdate(ctx, plaintext.data(), &len, encrypted_data, static_cast<int>(encrypted_len)) != 1) {
    EVP_CIPHER_CTX_free(ctx);
    throw IpcError(ErrorCode::AUTHENTICATION_FAILED, "Decryption failed");
  }

  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_TAG, GCM_TAG_SIZE, const_cast<uint8_t*>(tag)) != 1) {
    EVP_CIPHER_CTX_free(ctx);
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "Failed to set GCM tag");
  }

  int final_len = 0;
  if (EVP_DecryptFinal_ex(ctx, plaintext.data() + len, &final_len) != 1) {
    EVP_CIPHER_CTX_free(ctx);
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    throw IpcError(ErrorCode::AUTHENTICATION_FAILED, "GCM tag did not verify");
  }

  EVP_CIPHER_CTX_free(ctx);
  return std::string(plaintext.begin(), plaintext.begin() + len + final_len);
}

/* ============================================================
 *                        RSA PKCS#1 v1.5
 * ============================================================ */

std::vector<uint8_t> rsa_encrypt_pkcs1(const RsaKey& public_key, const uint8_t* data, size_t len) {
  if (public_key.empty()) {
    throw IpcError(ErrorCode::INVALID_KEY, "empty key");
  }
  if (len > public_key.max_legacy_plaintext()) {
    throw IpcError(ErrorCode::PLAINTEXT_TOO_LARGE, std::to_string(len) + " bytes exceeds RSA block limit of " + std::to_string(public_key.max_legacy_plaintext()));
  }

  EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(public_key.get(), nullptr);
  if (!ctx) {
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "Failed to create EVP_PKEY_CTX");
  }

  if (EVP_PKEY_encrypt_init(ctx) <= 0 || EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_PADDING) <= 0) {
    EVP_PKEY_CTX_free(ctx);
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "Failed to init RSA encryption");
  }

  size_t out_len = 0;
  if (EVP_PKEY_encrypt(ctx, nullptr, &out_len, data, len) <= 0) {
    EVP_PKEY_CTX_free(ctx);
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "Failed to size RSA ciphertext");
  }

  std::vector<uint8_t> out(out_len);
  if (EVP_PKEY_encrypt(ctx, out.data(), &out_len, data, len) <= 0) {
    EVP_PKEY_CTX_free(ctx);
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "RSA encryption failed");
  }

  EVP_PKEY_CTX_free(ctx);
  out.resize(out_len);
  return out;
}

std::vector<uint8_t> rsa_decrypt_pkcs1(const RsaKey& private_key, const std::vector<uint8_t>& ciphertext) {
  if (private_key.empty() || !private_key.has_private()) {
    throw IpcError(ErrorCode::INVALID_KEY, "decryption needs a private key");
  }

  EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(private_key.get(), nullptr);
  if (!ctx) {
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "Failed to create EVP_PKEY_CTX");
  }

  if (EVP_PKEY_decrypt_init(ctx) <= 0 || EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_PADDING) <= 0) {
    EVP_PKEY_CTX_free(ctx);
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "Failed to init RSA decryption");
  }

#ifdef OSSL_ASYM_CIPHER_PARAM_IMPLICIT_REJECTION
  // OpenSSL 3.2+ returns synthetic plaintext on bad padding by default.
  // Legacy bodies carry no tag, so a padding failure must surface here.
  unsigned int implicit_rejection = 0;
  OSSL_PARAM params[] = {OSSL_PARAM_construct_uint(OSSL_ASYM_CIPHER_PARAM_IMPLICIT_REJECTION, &implicit_rejection), OSSL_PARAM_construct_end()};
  if (EVP_PKEY_CTX_set_params(ctx, params) <= 0) {
    EVP_PKEY_CTX_free(ctx);
    throw IpcError(ErrorCode::CRYPTO_FAILURE, "Failed to disable RSA implicit rejection");
  }
#endif

  // One error for every cause (size, padding, format): no padding oracle.
  size_t out_len = private_key.modulus_bytes();
  std::vector<uint8_t> out(out_len);
  if (ciphertext.size() != out_len || EVP_PKEY_decrypt(ctx, out.data(), &out_len, ciphertext.data(), ciphertext.size()) <= 0) {
    EVP_PKEY_CTX_free(ctx);
    ERR_clear_error();
    throw IpcError(ErrorCode::KEY_UNWRAP_FAILED, "RSA decryption failed");
  }

  EVP_PKEY_CTX_free(ctx);
  out.resize(out_len);
  return out;
}

/* ============================================================
 *                        Hybrid / legacy
 * ============================================================ */

SecureFields hybrid_encrypt(const std::string& plaintext, const RsaKey& recipient, const RandomSource& random) {
  // Fresh key and nonce for every message.
  uint8_t key[AES_KEY_SIZE];
  uint8_t nonce[GCM_NONCE_SIZE];
  random(key, sizeof(key));
  random(nonce, sizeof(nonce));

  SecureFields fields;
  fields.hybrid = true;
  try {
    std::vector<uint8_t> sealed = aes_gcm_encrypt(plaintext, key, nonce);
    std::vector<uint8_t> wrapped = rsa_encrypt_pkcs1(recipient, key, sizeof(key));
    fields.secure_key = base64_encode(wrapped);
    fields.iv = base64_encode(nonce, sizeof(nonce));
    fields.secure_payload = base64_encode(sealed);
  } catch (...) {
    OPENSSL_cleanse(key, sizeof(key));
    throw;
  }
  OPENSSL_cleanse(key, sizeof(key));
  return fields;
}

SecureFields legacy_encrypt(const std::string& plaintext, const RsaKey& recipient) {
  std::vector<uint8_t> encrypted = rsa_encrypt_pkcs1(recipient, reinterpret_cast<const uint8_t*>(plaintext.data()), plaintext.size());
  SecureFields fields;
  fields.secure_payload = base64_encode(encrypted);
  return fields;
}

static std::string hybrid_decrypt(const SecureFields& fields, const RsaKey& private_key) {
  std::vector<uint8_t> wrapped;
  if (!base64_decode(fields.secure_key, wrapped)) {
    throw IpcError(ErrorCode::KEY_UNWRAP_FAILED, "RSA decryption failed");
  }
  std::vector<uint8_t> key = rsa_decrypt_pkcs1(private_key, wrapped);
  if (key.size() != AES_KEY_SIZE) {
    OPENSSL_cleanse(key.data(), key.size());
    throw IpcError(ErrorCode::KEY_UNWRAP_FAILED, "RSA decryption failed");
  }

  std::vector<uint8_t> nonce;
  std::vector<uint8_t> sealed;
  if (!base64_decode(fields.iv, nonce) || nonce.size() != GCM_NONCE_SIZE || !base64_decode(fields.secure_payload, sealed)) {
    OPENSSL_cleanse(key.data(), key.size());
    throw IpcError(ErrorCode::AUTHENTICATION_FAILED, "malformed nonce or ciphertext");
  }

  try {
    std::string plaintext = aes_gcm_decrypt(sealed, key.data(), nonce.data());
    OPENSSL_cleanse(key.data(), key.size());
    return plaintext;
  } catch (...) {
    OPENSSL_cleanse(key.data(), key.size());
    throw;
  }
}

static std::string legacy_decrypt(const SecureFields& fields, const RsaKey& private_key) {
  std::vector<uint8_t> encrypted;
  if (!base64_decode(fields.secure_payload, encrypted)) {
    throw IpcError(ErrorCode::KEY_UNWRAP_FAILED, "RSA decryption failed");
  }
  std::vector<uint8_t> plaintext = rsa_decrypt_pkcs1(private_key, encrypted);
  return std::string(plaintext.begin(), plaintext.end());
}

std::string decrypt_fields(const SecureFields& fields, const RsaKey& private_key) {
  if (fields.hybrid)
    return hybrid_decrypt(fields, private_key);
  return legacy_decrypt(fields, private_key);
}
