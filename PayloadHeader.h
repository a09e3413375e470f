#pragma once
#include "common.h"
#include "ByteReader.h"
#include <vector>

// Generic payload header preceding every payload body:
// next payload (1) | C + RESERVED (1) | payload length (2)
struct PayloadHeader {
    static constexpr uint8_t CRITICAL_BIT = 0x80;

    PayloadType next_payload;
    bool critical;
    uint16_t payload_length;

    PayloadHeader() : next_payload(PayloadType::NO_NEXT_PAYLOAD), critical(false),
                      payload_length(GENERIC_PAYLOAD_HEADER_LENGTH) {}

    PayloadHeader(PayloadType next, bool is_critical, size_t body_length)
        : next_payload(next), critical(is_critical),
          payload_length(static_cast<uint16_t>(GENERIC_PAYLOAD_HEADER_LENGTH + body_length)) {
        if (GENERIC_PAYLOAD_HEADER_LENGTH + body_length > 0xffff) {
            throw std::length_error("Payload body too large: " + std::to_string(body_length));
        }
    }

    void encode(std::vector<uint8_t>& out) const {
        out.push_back(static_cast<uint8_t>(next_payload));
        // Reserved bits are always sent as zero
        out.push_back(critical ? CRITICAL_BIT : 0);
        appendUint16(out, payload_length);
    }

    // Reserved bits are ignored on receipt
    static PayloadHeader decode(ByteReader& reader) {
        PayloadHeader header;
        header.next_payload = static_cast<PayloadType>(reader.readUint8());
        header.critical = (reader.readUint8() & CRITICAL_BIT) != 0;
        header.payload_length = reader.readUint16();
        return header;
    }

    size_t bodyLength() const {
        return checkedBodyLength(payload_length, GENERIC_PAYLOAD_HEADER_LENGTH, "payload");
    }
};
