#pragma once
#include "common.h"
#include "ByteReader.h"
#include "DHKeyExchange.h"
#include <vector>
#include <memory>

// Key Exchange payload: DH Group Num (2) | RESERVED (2) | Key Exchange Data
class KEPayload {
public:
    bool critical;
    uint16_t dh_group;
    std::vector<uint8_t> key_exchange_data;
    bool is_supported_group;

    // Present only on payloads built locally; never serialized
    std::shared_ptr<DHKeyExchange> local_key;

    KEPayload() : critical(false), dh_group(0), is_supported_group(false) {}

    static KEPayload createOutbound(DHGroup group) {
        KEPayload ke;
        ke.dh_group = static_cast<uint16_t>(group);
        ke.local_key = DHKeyExchange::generate(group);
        ke.key_exchange_data = ke.local_key->getPublicKey();
        ke.is_supported_group = true;
        return ke;
    }

    DHGroup getDHGroup() const { return static_cast<DHGroup>(dh_group); }

    // Consumes the local private key
    std::vector<uint8_t> computeSharedSecret(const std::vector<uint8_t>& peer_public_value) {
        if (!local_key) {
            throw std::logic_error("KE payload has no local private key");
        }
        std::vector<uint8_t> secret = local_key->computeSharedSecret(peer_public_value);
        local_key.reset();
        return secret;
    }

    PayloadType getPayloadType() const { return PayloadType::KE; }

    void encodeBody(std::vector<uint8_t>& out) const {
        appendUint16(out, dh_group);
        out.push_back(0); // Reserved
        out.push_back(0); // Reserved
        appendBytes(out, key_exchange_data);
    }

    // Data length is validated for known groups only. A payload for an unknown
    // group is kept so the caller can answer with INVALID_KE_PAYLOAD.
    static KEPayload decode(bool critical, ByteReader& body) {
        KEPayload ke;
        ke.critical = critical;
        ke.dh_group = body.readUint16();
        body.skip(2);
        ke.key_exchange_data = body.readRemaining();

        const DHGroupParams* params = DHKeyExchange::findGroup(ke.dh_group);
        ke.is_supported_group = params != nullptr;
        if (params && ke.key_exchange_data.size() != params->public_value_length) {
            throw IkeSyntaxException("Invalid KE payload length for provided DH group: "
                                     + std::to_string(ke.key_exchange_data.size()));
        }
        return ke;
    }

    bool operator==(const KEPayload& other) const {
        return critical == other.critical && dh_group == other.dh_group
            && key_exchange_data == other.key_exchange_data;
    }
};
