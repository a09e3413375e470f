#pragma once
#include "common.h"
#include "ByteReader.h"
#include "IKECrypto.h"
#include <vector>

class NoncePayload {
public:
    static constexpr size_t MIN_NONCE_LEN = 16;
    static constexpr size_t MAX_NONCE_LEN = 256;
    static constexpr size_t DEFAULT_NONCE_LEN = 32;

    bool critical;
    std::vector<uint8_t> nonce_data;

    explicit NoncePayload(const std::vector<uint8_t>& nonce) : critical(false), nonce_data(nonce) {}

    static NoncePayload generate(size_t length = DEFAULT_NONCE_LEN) {
        if (length < MIN_NONCE_LEN || length > MAX_NONCE_LEN) {
            throw std::invalid_argument("Nonce length out of range: " + std::to_string(length));
        }
        return NoncePayload(IKECrypto::randomBytes(length));
    }

    PayloadType getPayloadType() const { return PayloadType::NONCE; }

    void encodeBody(std::vector<uint8_t>& out) const {
        appendBytes(out, nonce_data);
    }

    static NoncePayload decode(bool critical, ByteReader& body) {
        NoncePayload nonce(body.readRemaining());
        nonce.critical = critical;
        if (nonce.nonce_data.size() < MIN_NONCE_LEN || nonce.nonce_data.size() > MAX_NONCE_LEN) {
            throw IkeSyntaxException("Invalid nonce length: "
                                     + std::to_string(nonce.nonce_data.size()));
        }
        return nonce;
    }

    bool operator==(const NoncePayload& other) const {
        return critical == other.critical && nonce_data == other.nonce_data;
    }
};
