#pragma once
#include "common.h"
#include "PayloadHeader.h"
#include "SAPayload.h"
#include "KEPayload.h"
#include "IdentityPayload.h"
#include "AuthPayload.h"
#include "NoncePayload.h"
#include "NotifyPayload.h"
#include "DeletePayload.h"
#include "TrafficSelectorPayload.h"
#include <variant>
#include <vector>

// Placeholder for a payload type this codec does not implement. Only the type
// code and the critical bit are kept; the body is discarded.
struct UnsupportedPayload {
    bool critical;
    uint8_t payload_type;

    UnsupportedPayload(uint8_t type, bool is_critical) : critical(is_critical), payload_type(type) {}

    PayloadType getPayloadType() const { return static_cast<PayloadType>(payload_type); }

    void encodeBody(std::vector<uint8_t>&) const {
        throw std::logic_error("Cannot encode unsupported payload type "
                               + std::to_string(payload_type));
    }

    bool operator==(const UnsupportedPayload& other) const {
        return critical == other.critical && payload_type == other.payload_type;
    }
};

using IKEPayload = std::variant<SAPayload,
                                KEPayload,
                                IdentityPayload,
                                AuthPskPayload,
                                AuthDigitalSignPayload,
                                NoncePayload,
                                NotifyPayload,
                                DeletePayload,
                                TrafficSelectorPayload,
                                UnsupportedPayload>;

inline PayloadType getPayloadType(const IKEPayload& payload) {
    return std::visit([](const auto& p) { return p.getPayloadType(); }, payload);
}

inline bool isCritical(const IKEPayload& payload) {
    return std::visit([](const auto& p) { return p.critical; }, payload);
}

inline std::vector<uint8_t> encodePayloadBody(const IKEPayload& payload) {
    std::vector<uint8_t> body;
    std::visit([&body](const auto& p) { p.encodeBody(body); }, payload);
    return body;
}

// Generic header length plus body length
inline size_t getPayloadLength(const IKEPayload& payload) {
    return GENERIC_PAYLOAD_HEADER_LENGTH + encodePayloadBody(payload).size();
}

inline void encodePayload(const IKEPayload& payload, PayloadType next_payload,
                          std::vector<uint8_t>& out) {
    std::vector<uint8_t> body = encodePayloadBody(payload);
    PayloadHeader header(next_payload, isCritical(payload), body.size());
    header.encode(out);
    appendBytes(out, body);
}
