#pragma once
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <sstream>
#include <iomanip>
#include <cstdint>
#include <arpa/inet.h>
#include <openssl/err.h>
#include "IKEException.h"

// Utility macros for error checking
#define CHECK_OPENSSL(expr) \
    do { \
        if (!(expr)) { \
            unsigned long err = ERR_get_error(); \
            char buf[256]; \
            ERR_error_string_n(err, buf, sizeof(buf)); \
            throw IkeCryptoException(std::string("OpenSSL error: ") + buf); \
        } \
    } while(0)

#define IKE_HEADER_LENGTH 28
#define GENERIC_PAYLOAD_HEADER_LENGTH 4
#define NON_ESP_MARKER_LENGTH 4
#define UDP_ENCAP_PORT 4500

// IKEv2 Exchange Types
enum class IKEMessageType : uint8_t {
    IKE_SA_INIT = 34,
    IKE_AUTH = 35,
    CREATE_CHILD_SA = 36,
    INFORMATIONAL = 37
};

// IKEv2 Payload Types. Values outside this list still fit in the enum and
// decode as unsupported payloads.
enum class PayloadType : uint8_t {
    NO_NEXT_PAYLOAD = 0,
    SA = 33,
    KE = 34,
    IDi = 35,
    IDr = 36,
    CERT = 37,
    CERTREQ = 38,
    AUTH = 39,
    NONCE = 40,
    N = 41,
    D = 42,
    V = 43,
    TSi = 44,
    TSr = 45,
    SK = 46
};

// IKE Flags
enum IKEFlags : uint8_t {
    RESPONSE_FLAG = 0x20,
    VERSION_FLAG = 0x10,
    INITIATOR_FLAG = 0x08
};

// Transform Types
enum class TransformType : uint8_t {
    ENCR = 1,  // Encryption Algorithm
    PRF = 2,   // Pseudo-random Function
    INTEG = 3, // Integrity Algorithm
    DH = 4,    // Diffie-Hellman Group
    ESN = 5    // Extended Sequence Numbers
};

// Encryption Algorithms
enum class EncryptionAlgorithm : uint16_t {
    ENCR_3DES = 3,
    AES_CBC = 12
};

// PRF Algorithms
enum class PRFAlgorithm : uint16_t {
    PRF_HMAC_SHA1 = 2,
    PRF_HMAC_SHA256 = 5
};

// Integrity Algorithms
enum class IntegrityAlgorithm : uint16_t {
    AUTH_HMAC_SHA1_96 = 2,
    AUTH_HMAC_SHA256_128 = 12,
    AUTH_HMAC_SHA384_192 = 13,
    AUTH_HMAC_SHA512_256 = 14
};

// DH Groups
enum class DHGroup : uint16_t {
    NONE = 0,
    MODP_1024 = 2,
    MODP_2048 = 14
};

// Protocol IDs
enum class ProtocolID : uint8_t {
    UNSET = 0,
    IKE = 1,
    AH = 2,
    ESP = 3
};

// Big-endian writers
inline void appendUint16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}

inline void appendUint32(std::vector<uint8_t>& out, uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(value >> shift));
    }
}

inline void appendUint64(std::vector<uint8_t>& out, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(value >> shift));
    }
}

inline void appendBytes(std::vector<uint8_t>& out, const std::vector<uint8_t>& data) {
    out.insert(out.end(), data.begin(), data.end());
}

inline std::string bytesToHex(const std::vector<uint8_t>& data) {
    std::ostringstream oss;
    for (auto b : data) {
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)b;
    }
    return oss.str();
}
