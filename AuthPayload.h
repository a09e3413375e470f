#pragma once
#include "common.h"
#include "ByteReader.h"
#include "IKECrypto.h"
#include <vector>
#include <string>

// AUTH payload: Auth Method (1) | RESERVED (3) | Authentication Data.
// Method 2 decodes to AuthPskPayload; methods 1 and 14 decode to
// AuthDigitalSignPayload. Every other method fails authentication.
enum AuthMethod : uint8_t {
    RSA_DIGITAL_SIGNATURE = 1,
    SHARED_KEY_MESSAGE_INTEGRITY_CODE = 2,
    GENERIC_DIGITAL_SIGNATURE = 14
};

class AuthPayload {
public:
    static constexpr size_t AUTH_HEADER_LEN = 4;

    static std::vector<uint8_t> signWithPrf(const Prf& prf, const std::vector<uint8_t>& key,
                                            const std::vector<uint8_t>& data) {
        return prf.sign(key, data);
    }

    // <SignedOctets> = <RealMessage> | <Nonce> | prf(SK_p, <ID body>)
    static std::vector<uint8_t> computeSignedOctets(const std::vector<uint8_t>& message_bytes,
                                                    const std::vector<uint8_t>& nonce,
                                                    const std::vector<uint8_t>& id_payload_body,
                                                    const Prf& prf,
                                                    const std::vector<uint8_t>& prf_key) {
        std::vector<uint8_t> signed_octets = message_bytes;
        appendBytes(signed_octets, nonce);
        appendBytes(signed_octets, signWithPrf(prf, prf_key, id_payload_body));
        return signed_octets;
    }

    static void encodeAuthHeader(uint8_t method, std::vector<uint8_t>& out) {
        out.push_back(method);
        out.push_back(0); // Reserved
        out.push_back(0); // Reserved
        out.push_back(0); // Reserved
    }
};

class AuthPskPayload {
public:
    bool critical;
    std::vector<uint8_t> signature;

    explicit AuthPskPayload(const std::vector<uint8_t>& sig) : critical(false), signature(sig) {}

    // AUTH = prf(prf(Shared Secret, "Key Pad for IKEv2"), <SignedOctets>)
    static std::vector<uint8_t> computePskAuth(const std::vector<uint8_t>& psk,
                                               const std::vector<uint8_t>& signed_octets,
                                               const Prf& prf) {
        static const std::string key_pad = "Key Pad for IKEv2";
        std::vector<uint8_t> key_pad_vec(key_pad.begin(), key_pad.end());

        std::vector<uint8_t> auth_key = AuthPayload::signWithPrf(prf, psk, key_pad_vec);
        return AuthPayload::signWithPrf(prf, auth_key, signed_octets);
    }

    static AuthPskPayload createOutbound(const std::vector<uint8_t>& psk,
                                         const std::vector<uint8_t>& message_bytes,
                                         const std::vector<uint8_t>& nonce,
                                         const std::vector<uint8_t>& id_payload_body,
                                         const Prf& prf,
                                         const std::vector<uint8_t>& prf_key) {
        std::vector<uint8_t> signed_octets = AuthPayload::computeSignedOctets(
            message_bytes, nonce, id_payload_body, prf, prf_key);
        return AuthPskPayload(computePskAuth(psk, signed_octets, prf));
    }

    // Recomputes the MAC locally and compares in constant time
    void verifyInboundSignature(const std::vector<uint8_t>& psk,
                                const std::vector<uint8_t>& message_bytes,
                                const std::vector<uint8_t>& nonce,
                                const std::vector<uint8_t>& id_payload_body,
                                const Prf& prf,
                                const std::vector<uint8_t>& prf_key) const {
        std::vector<uint8_t> signed_octets = AuthPayload::computeSignedOctets(
            message_bytes, nonce, id_payload_body, prf, prf_key);
        std::vector<uint8_t> expected = computePskAuth(psk, signed_octets, prf);

        if (expected.size() != signature.size()
            || !IKECrypto::constantTimeEquals(expected.data(), signature.data(), expected.size())) {
            throw IkeAuthenticationFailedException("Signature verification failed");
        }
    }

    PayloadType getPayloadType() const { return PayloadType::AUTH; }

    void encodeBody(std::vector<uint8_t>& out) const {
        AuthPayload::encodeAuthHeader(SHARED_KEY_MESSAGE_INTEGRITY_CODE, out);
        appendBytes(out, signature);
    }

    // body is positioned after the method and reserved bytes
    static AuthPskPayload decode(bool critical, ByteReader& body) {
        AuthPskPayload auth(body.readRemaining());
        auth.critical = critical;
        if (auth.signature.empty()) {
            throw IkeSyntaxException("Empty authentication data in AUTH payload");
        }
        return auth;
    }

    bool operator==(const AuthPskPayload& other) const {
        return critical == other.critical && signature == other.signature;
    }
};

// RSA (method 1) and generic RFC 7427 (method 14) signatures. For method 14
// the data starts with a one-byte length and the ASN.1 AlgorithmIdentifier of
// the signature scheme.
class AuthDigitalSignPayload {
public:
    bool critical;
    uint8_t auth_method;
    std::vector<uint8_t> signature_algorithm;
    std::vector<uint8_t> signature;

    AuthDigitalSignPayload(AuthMethod method, const std::vector<uint8_t>& algorithm,
                           const std::vector<uint8_t>& sig)
        : critical(false), auth_method(method), signature_algorithm(algorithm), signature(sig) {
        if (method != RSA_DIGITAL_SIGNATURE && method != GENERIC_DIGITAL_SIGNATURE) {
            throw std::invalid_argument("Not a digital signature method: " + std::to_string(method));
        }
        if (method == RSA_DIGITAL_SIGNATURE && !algorithm.empty()) {
            throw std::invalid_argument("RSA signature method carries no algorithm identifier");
        }
        if (algorithm.size() > 0xff) {
            throw std::invalid_argument("Algorithm identifier too long");
        }
    }

    PayloadType getPayloadType() const { return PayloadType::AUTH; }

    void encodeBody(std::vector<uint8_t>& out) const {
        AuthPayload::encodeAuthHeader(auth_method, out);
        if (auth_method == GENERIC_DIGITAL_SIGNATURE) {
            out.push_back(static_cast<uint8_t>(signature_algorithm.size()));
            appendBytes(out, signature_algorithm);
        }
        appendBytes(out, signature);
    }

    static AuthDigitalSignPayload decode(bool critical, AuthMethod method, ByteReader& body) {
        std::vector<uint8_t> algorithm;
        if (method == GENERIC_DIGITAL_SIGNATURE) {
            uint8_t algorithm_len = body.readUint8();
            algorithm = body.readBytes(algorithm_len);
        }
        AuthDigitalSignPayload auth(method, algorithm, body.readRemaining());
        auth.critical = critical;
        if (auth.signature.empty()) {
            throw IkeSyntaxException("Empty signature in AUTH payload");
        }
        return auth;
    }

    bool operator==(const AuthDigitalSignPayload& other) const {
        return critical == other.critical && auth_method == other.auth_method
            && signature_algorithm == other.signature_algorithm && signature == other.signature;
    }
};
