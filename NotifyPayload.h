#pragma once
#include "common.h"
#include "ByteReader.h"
#include <vector>

// Notify payload:
// Protocol ID (1) | SPI Size (1) | Notify Message Type (2) | SPI | Notification Data
class NotifyPayload {
public:
    // Error types below 16384, status types from 16384 (RFC 7296 section 3.10.1)
    static constexpr uint16_t NOTIFY_TYPE_ERROR_MAX = 16383;
    static constexpr uint16_t NOTIFY_TYPE_INVALID_KE_PAYLOAD = 17;

    static constexpr size_t SPI_LEN_IPSEC = 4;

    bool critical;
    uint8_t protocol_id;
    uint16_t notify_type;
    std::vector<uint8_t> spi;
    std::vector<uint8_t> notification_data;

    NotifyPayload(uint16_t type, const std::vector<uint8_t>& data = {})
        : critical(false), protocol_id(static_cast<uint8_t>(ProtocolID::UNSET)), notify_type(type),
          notification_data(data) {}

    NotifyPayload(ProtocolID protocol, uint32_t child_spi, uint16_t type,
                  const std::vector<uint8_t>& data = {})
        : critical(false), protocol_id(static_cast<uint8_t>(protocol)), notify_type(type),
          notification_data(data) {
        if (protocol != ProtocolID::AH && protocol != ProtocolID::ESP) {
            throw std::invalid_argument("Only AH and ESP notifications carry an SPI");
        }
        appendUint32(spi, child_spi);
    }

    // Notification data is the one-octet type of the rejected payload
    static NotifyPayload unsupportedCriticalPayload(uint8_t payload_type) {
        return NotifyPayload(UNSUPPORTED_CRITICAL_PAYLOAD, std::vector<uint8_t>{payload_type});
    }

    // Answer to a KE payload for an unsupported group, naming the group the
    // responder expects
    static NotifyPayload invalidKePayload(DHGroup accepted_group) {
        std::vector<uint8_t> data;
        appendUint16(data, static_cast<uint16_t>(accepted_group));
        return NotifyPayload(NOTIFY_TYPE_INVALID_KE_PAYLOAD, data);
    }

    bool isErrorNotify() const { return notify_type <= NOTIFY_TYPE_ERROR_MAX; }

    PayloadType getPayloadType() const { return PayloadType::N; }

    void encodeBody(std::vector<uint8_t>& out) const {
        out.push_back(protocol_id);
        out.push_back(static_cast<uint8_t>(spi.size()));
        appendUint16(out, notify_type);
        appendBytes(out, spi);
        appendBytes(out, notification_data);
    }

    static NotifyPayload decode(bool critical, ByteReader& body) {
        uint8_t protocol = body.readUint8();
        uint8_t spi_size = body.readUint8();
        uint16_t type = body.readUint16();

        switch (static_cast<ProtocolID>(protocol)) {
            case ProtocolID::UNSET:
            case ProtocolID::IKE:
                if (spi_size != 0) {
                    throw IkeSyntaxException("Invalid SPI size for IKE notification: "
                                             + std::to_string(spi_size));
                }
                break;
            case ProtocolID::AH:
            case ProtocolID::ESP:
                if (spi_size != 0 && spi_size != SPI_LEN_IPSEC) {
                    throw IkeSyntaxException("Invalid SPI size for Child SA notification: "
                                             + std::to_string(spi_size));
                }
                break;
            default:
                throw IkeSyntaxException("Invalid protocol ID in notification: "
                                         + std::to_string(protocol));
        }

        NotifyPayload notify(type);
        notify.critical = critical;
        notify.protocol_id = protocol;
        notify.spi = body.readBytes(spi_size);
        notify.notification_data = body.readRemaining();
        return notify;
    }

    bool operator==(const NotifyPayload& other) const {
        return critical == other.critical && protocol_id == other.protocol_id
            && notify_type == other.notify_type && spi == other.spi
            && notification_data == other.notification_data;
    }
};
