#pragma once
#include "common.h"
#include "IKEHeader.h"
#include "IKEPayload.h"
#include "IKECrypto.h"
#include <optional>
#include <vector>

class DecodeResult;

class IKEMessage {
private:
    IKEHeader header;
    std::vector<IKEPayload> payloads;

public:
    IKEMessage(const IKEHeader& h, const std::vector<IKEPayload>& payload_list)
        : header(h), payloads(payload_list) {}

    const IKEHeader& getHeader() const { return header; }
    const std::vector<IKEPayload>& getPayloads() const { return payloads; }

    // First payload of the given kind, or nullptr
    template <typename T>
    const T* getPayload() const {
        for (const auto& p : payloads) {
            if (const T* typed = std::get_if<T>(&p)) {
                return typed;
            }
        }
        return nullptr;
    }

    template <typename T>
    std::vector<T> getPayloadList() const {
        std::vector<T> out;
        for (const auto& p : payloads) {
            if (const T* typed = std::get_if<T>(&p)) {
                out.push_back(*typed);
            }
        }
        return out;
    }

    std::vector<uint8_t> encode() const;

    std::vector<uint8_t> encryptAndEncode(const IntegrityMac& integrity_mac, size_t checksum_len,
                                          const IkeCipher& cipher,
                                          const std::vector<uint8_t>& key) const;

    // Unprotected message, e.g. IKE_SA_INIT
    static DecodeResult decode(const IKEHeader& header, const std::vector<uint8_t>& packet);

    // Message protected by an SK payload
    static DecodeResult decode(const IKEHeader& header, const std::vector<uint8_t>& packet,
                               const IntegrityMac& integrity_mac, size_t checksum_len,
                               const IkeCipher& cipher, const std::vector<uint8_t>& key);

    static std::vector<uint8_t> encodePayloadList(const std::vector<IKEPayload>& payload_list);

    // Walks the chain starting at first_payload. Supported payloads are
    // returned in wire order; unsupported non-critical ones are dropped.
    static std::vector<IKEPayload> decodePayloadList(PayloadType first_payload, bool is_response,
                                                     const uint8_t* data, size_t length);
};

enum class DecodeStatus {
    OK,
    // Failure before the message was authenticated. Never answered.
    UNPROTECTED_ERROR,
    // Failure in an authenticated message. May be answered with an error notify.
    PROTECTED_ERROR
};

class DecodeResult {
private:
    DecodeStatus status;
    std::optional<IKEMessage> message;
    uint16_t error_code;
    std::string error_message;
    std::vector<uint8_t> unsupported_payloads;

    DecodeResult(DecodeStatus s, std::optional<IKEMessage> msg, uint16_t code,
                 const std::string& text, const std::vector<uint8_t>& unsupported)
        : status(s), message(std::move(msg)), error_code(code), error_message(text),
          unsupported_payloads(unsupported) {}

public:
    static DecodeResult ok(IKEMessage msg) {
        return DecodeResult(DecodeStatus::OK, std::move(msg), 0, "", {});
    }

    static DecodeResult error(DecodeStatus s, const IkeException& e);

    DecodeStatus getStatus() const { return status; }
    bool isOk() const { return status == DecodeStatus::OK; }

    // Throws std::logic_error unless the decode succeeded
    const IKEMessage& getMessage() const;

    // RFC 7296 notify type of the failure, 0 for integrity/decryption failures
    uint16_t getErrorCode() const { return error_code; }
    const std::string& getErrorMessage() const { return error_message; }
    const std::vector<uint8_t>& getUnsupportedPayloads() const { return unsupported_payloads; }

    // Notify payload to report this failure to the peer
    NotifyPayload buildErrorNotify() const;
};
