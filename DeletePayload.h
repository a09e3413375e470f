#pragma once
#include "common.h"
#include "ByteReader.h"
#include <vector>

// Delete payload: Protocol ID (1) | SPI Size (1) | Num of SPIs (2) | SPIs
class DeletePayload {
public:
    static constexpr size_t SPI_LEN_IPSEC = 4;

    bool critical;
    uint8_t protocol_id;
    std::vector<uint32_t> spis;

    // Deletes the IKE SA the message is protected by
    DeletePayload() : critical(false), protocol_id(static_cast<uint8_t>(ProtocolID::IKE)) {}

    DeletePayload(ProtocolID protocol, const std::vector<uint32_t>& child_spis)
        : critical(false), protocol_id(static_cast<uint8_t>(protocol)), spis(child_spis) {
        if (protocol != ProtocolID::AH && protocol != ProtocolID::ESP) {
            throw std::invalid_argument("Child SA delete must be AH or ESP");
        }
        if (spis.empty() || spis.size() > 0xffff) {
            throw std::invalid_argument("Child SA delete needs 1..65535 SPIs");
        }
    }

    bool isIkeDelete() const { return protocol_id == static_cast<uint8_t>(ProtocolID::IKE); }

    PayloadType getPayloadType() const { return PayloadType::D; }

    void encodeBody(std::vector<uint8_t>& out) const {
        out.push_back(protocol_id);
        out.push_back(static_cast<uint8_t>(isIkeDelete() ? 0 : SPI_LEN_IPSEC));
        appendUint16(out, static_cast<uint16_t>(spis.size()));
        for (uint32_t spi : spis) {
            appendUint32(out, spi);
        }
    }

    static DeletePayload decode(bool critical, ByteReader& body) {
        uint8_t protocol = body.readUint8();
        uint8_t spi_size = body.readUint8();
        uint16_t num_spis = body.readUint16();

        DeletePayload del;
        del.critical = critical;
        del.protocol_id = protocol;

        switch (static_cast<ProtocolID>(protocol)) {
            case ProtocolID::IKE:
                if (spi_size != 0 || num_spis != 0) {
                    throw IkeSyntaxException("IKE SA delete must not carry SPIs");
                }
                break;
            case ProtocolID::AH:
            case ProtocolID::ESP:
                if (spi_size != SPI_LEN_IPSEC) {
                    throw IkeSyntaxException("Invalid SPI size in Child SA delete: "
                                             + std::to_string(spi_size));
                }
                break;
            default:
                throw IkeSyntaxException("Invalid protocol ID in delete payload: "
                                         + std::to_string(protocol));
        }

        if (body.remaining() != static_cast<size_t>(num_spis) * spi_size) {
            throw IkeSyntaxException("Delete payload length does not match its SPI count");
        }
        for (int i = 0; i < num_spis; ++i) {
            del.spis.push_back(body.readUint32());
        }
        return del;
    }

    bool operator==(const DeletePayload& other) const {
        return critical == other.critical && protocol_id == other.protocol_id
            && spis == other.spis;
    }
};
