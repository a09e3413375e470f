#pragma once
#include "common.h"
#include <vector>
#include <memory>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/hmac.h>
#include <openssl/crypto.h>

// Cryptographic operations
class IKECrypto {
public:
    static std::vector<uint8_t> hmac(const EVP_MD* md, const std::vector<uint8_t>& key,
                                     const std::vector<uint8_t>& data) {
        std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
        unsigned int len = 0;

        CHECK_OPENSSL(HMAC(md, key.data(), static_cast<int>(key.size()),
                           data.data(), data.size(), result.data(), &len));

        result.resize(len);
        return result;
    }

    static std::vector<uint8_t> randomBytes(size_t length) {
        std::vector<uint8_t> out(length);
        if (length > 0) {
            CHECK_OPENSSL(RAND_bytes(out.data(), static_cast<int>(out.size())) == 1);
        }
        return out;
    }

    static bool constantTimeEquals(const uint8_t* a, const uint8_t* b, size_t length) {
        return CRYPTO_memcmp(a, b, length) == 0;
    }
};

// Integrity algorithm with its key already bound, used to compute the
// checksum of an encrypted payload.
class IntegrityMac {
public:
    virtual ~IntegrityMac() = default;
    virtual std::vector<uint8_t> compute(const std::vector<uint8_t>& data) const = 0;
};

class HmacIntegrity : public IntegrityMac {
private:
    IntegrityAlgorithm algorithm;
    const EVP_MD* md;
    std::vector<uint8_t> key;

public:
    HmacIntegrity(IntegrityAlgorithm alg, const std::vector<uint8_t>& integrity_key)
        : algorithm(alg), md(nullptr), key(integrity_key) {
        switch (alg) {
            case IntegrityAlgorithm::AUTH_HMAC_SHA1_96: md = EVP_sha1(); break;
            case IntegrityAlgorithm::AUTH_HMAC_SHA256_128: md = EVP_sha256(); break;
            case IntegrityAlgorithm::AUTH_HMAC_SHA384_192: md = EVP_sha384(); break;
            case IntegrityAlgorithm::AUTH_HMAC_SHA512_256: md = EVP_sha512(); break;
            default:
                throw std::invalid_argument("Unsupported integrity algorithm: "
                                            + std::to_string(static_cast<int>(alg)));
        }
    }

    // Truncated checksum length defined by the algorithm
    size_t getChecksumLength() const {
        switch (algorithm) {
            case IntegrityAlgorithm::AUTH_HMAC_SHA1_96: return 12;
            case IntegrityAlgorithm::AUTH_HMAC_SHA256_128: return 16;
            case IntegrityAlgorithm::AUTH_HMAC_SHA384_192: return 24;
            case IntegrityAlgorithm::AUTH_HMAC_SHA512_256: return 32;
        }
        return 0;
    }

    std::vector<uint8_t> compute(const std::vector<uint8_t>& data) const override {
        return IKECrypto::hmac(md, key, data);
    }
};

// Pseudo-random function. sign() is a single-shot MAC over the whole input.
class Prf {
public:
    virtual ~Prf() = default;
    virtual std::vector<uint8_t> sign(const std::vector<uint8_t>& key,
                                      const std::vector<uint8_t>& data) const = 0;
};

class HmacPrf : public Prf {
private:
    const EVP_MD* md;

public:
    explicit HmacPrf(PRFAlgorithm alg) : md(nullptr) {
        switch (alg) {
            case PRFAlgorithm::PRF_HMAC_SHA1: md = EVP_sha1(); break;
            case PRFAlgorithm::PRF_HMAC_SHA256: md = EVP_sha256(); break;
            default:
                throw std::invalid_argument("Unsupported PRF: "
                                            + std::to_string(static_cast<int>(alg)));
        }
    }

    std::vector<uint8_t> sign(const std::vector<uint8_t>& key,
                              const std::vector<uint8_t>& data) const override {
        return IKECrypto::hmac(md, key, data);
    }
};

// Block cipher without implicit padding. IKE does its own padding inside the
// encrypted payload, so input to encrypt() and decrypt() must be a multiple
// of the block size.
class IkeCipher {
public:
    virtual ~IkeCipher() = default;
    virtual size_t getBlockSize() const = 0;
    virtual size_t getIvLength() const = 0;

    virtual std::vector<uint8_t> generateIv() const {
        return IKECrypto::randomBytes(getIvLength());
    }

    virtual std::vector<uint8_t> encrypt(const std::vector<uint8_t>& key,
                                         const std::vector<uint8_t>& iv,
                                         const std::vector<uint8_t>& plaintext) const = 0;
    virtual std::vector<uint8_t> decrypt(const std::vector<uint8_t>& key,
                                         const std::vector<uint8_t>& iv,
                                         const std::vector<uint8_t>& ciphertext) const = 0;
};

class AesCbcCipher : public IkeCipher {
private:
    struct CipherCtxDeleter {
        void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
    };
    using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

    static constexpr size_t AES_BLOCK_LEN = 16;

    const EVP_CIPHER* cipher;
    size_t key_length;

    std::vector<uint8_t> run(bool encrypting, const std::vector<uint8_t>& key,
                             const std::vector<uint8_t>& iv,
                             const std::vector<uint8_t>& input) const {
        if (key.size() != key_length) {
            throw std::invalid_argument("AES-CBC key must be " + std::to_string(key_length)
                                        + " bytes");
        }
        if (iv.size() != AES_BLOCK_LEN) {
            throw IkeCryptoException("Invalid AES-CBC IV length");
        }
        if (input.size() % AES_BLOCK_LEN != 0) {
            throw IkeCryptoException("AES-CBC input is not a multiple of the block size");
        }

        CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        CHECK_OPENSSL(ctx);

        std::vector<uint8_t> output(input.size() + AES_BLOCK_LEN);
        int len = 0;
        int total = 0;

        CHECK_OPENSSL(EVP_CipherInit_ex(ctx.get(), cipher, nullptr, key.data(), iv.data(),
                                        encrypting ? 1 : 0));
        CHECK_OPENSSL(EVP_CIPHER_CTX_set_padding(ctx.get(), 0));
        CHECK_OPENSSL(EVP_CipherUpdate(ctx.get(), output.data(), &len, input.data(),
                                       static_cast<int>(input.size())));
        total = len;
        CHECK_OPENSSL(EVP_CipherFinal_ex(ctx.get(), output.data() + total, &len));
        total += len;

        output.resize(total);
        return output;
    }

public:
    // key_bits is the negotiated Key Length attribute: 128, 192 or 256
    explicit AesCbcCipher(int key_bits) : cipher(nullptr), key_length(key_bits / 8) {
        switch (key_bits) {
            case 128: cipher = EVP_aes_128_cbc(); break;
            case 192: cipher = EVP_aes_192_cbc(); break;
            case 256: cipher = EVP_aes_256_cbc(); break;
            default:
                throw std::invalid_argument("Unsupported AES key length: "
                                            + std::to_string(key_bits));
        }
    }

    size_t getBlockSize() const override { return AES_BLOCK_LEN; }
    size_t getIvLength() const override { return AES_BLOCK_LEN; }
    size_t getKeyLength() const { return key_length; }

    std::vector<uint8_t> encrypt(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv,
                                 const std::vector<uint8_t>& plaintext) const override {
        return run(true, key, iv, plaintext);
    }

    std::vector<uint8_t> decrypt(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv,
                                 const std::vector<uint8_t>& ciphertext) const override {
        return run(false, key, iv, ciphertext);
    }
};
