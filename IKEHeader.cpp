#include "IKEHeader.h"
#include "ByteReader.h"

IKEHeader::IKEHeader(uint64_t ispi, uint64_t rspi, PayloadType next, uint8_t major, uint8_t minor,
                     uint8_t exchange, uint8_t header_flags, uint32_t msg_id, uint32_t total_length)
    : initiator_spi(ispi), responder_spi(rspi), next_payload(next), major_version(major),
      minor_version(minor), exchange_type(exchange), flags(header_flags), message_id(msg_id),
      length(total_length) {}

IKEHeader::IKEHeader(uint64_t ispi, uint64_t rspi, PayloadType next, IKEMessageType exchange,
                     bool is_response, bool from_initiator, uint32_t msg_id)
    : initiator_spi(ispi), responder_spi(rspi), next_payload(next),
      major_version(MAJOR_VERSION), minor_version(MINOR_VERSION),
      exchange_type(static_cast<uint8_t>(exchange)), flags(0), message_id(msg_id), length(0) {
    if (is_response) flags |= RESPONSE_FLAG;
    if (from_initiator) flags |= INITIATOR_FLAG;
}

IKEHeader IKEHeader::decode(const std::vector<uint8_t>& packet) {
    return decode(packet.data(), packet.size());
}

IKEHeader IKEHeader::decode(const uint8_t* packet, size_t packet_length) {
    if (packet_length < IKE_HEADER_LENGTH) {
        throw IkeSyntaxException("Invalid IKE header size: " + std::to_string(packet_length));
    }

    ByteReader reader(packet, IKE_HEADER_LENGTH);
    uint64_t ispi = reader.readUint64();
    uint64_t rspi = reader.readUint64();
    PayloadType next = static_cast<PayloadType>(reader.readUint8());
    uint8_t version = reader.readUint8();
    uint8_t exchange = reader.readUint8();
    uint8_t header_flags = reader.readUint8();
    uint32_t msg_id = reader.readUint32();
    uint32_t total_length = reader.readUint32();

    if (total_length != packet_length) {
        throw IkeSyntaxException("IKE header length " + std::to_string(total_length)
                                 + " does not match packet length "
                                 + std::to_string(packet_length));
    }

    return IKEHeader(ispi, rspi, next, version >> 4, version & 0x0f, exchange, header_flags,
                     msg_id, total_length);
}

void IKEHeader::checkInboundValid(size_t packet_length) const {
    if (packet_length < IKE_HEADER_LENGTH) {
        throw IkeSyntaxException("Packet shorter than IKE header");
    }
    if (major_version != MAJOR_VERSION) {
        throw IkeInvalidMajorVersionException(major_version);
    }
    if (exchange_type < static_cast<uint8_t>(IKEMessageType::IKE_SA_INIT)
        || exchange_type > static_cast<uint8_t>(IKEMessageType::INFORMATIONAL)) {
        throw IkeSyntaxException("Invalid exchange type: " + std::to_string(exchange_type));
    }
    if (length != packet_length) {
        throw IkeSyntaxException("IKE header length does not match packet length");
    }
}

void IKEHeader::encode(size_t body_length, std::vector<uint8_t>& out) const {
    appendUint64(out, initiator_spi);
    appendUint64(out, responder_spi);
    out.push_back(static_cast<uint8_t>(next_payload));
    out.push_back(static_cast<uint8_t>((major_version << 4) | (minor_version & 0x0f)));
    out.push_back(exchange_type);
    out.push_back(flags);
    appendUint32(out, message_id);
    appendUint32(out, static_cast<uint32_t>(IKE_HEADER_LENGTH + body_length));
}

IKEHeader IKEHeader::withNextPayload(PayloadType next) const {
    return IKEHeader(initiator_spi, responder_spi, next, major_version, minor_version,
                     exchange_type, flags, message_id, length);
}

std::string IKEHeader::toString() const {
    std::ostringstream oss;
    oss << "IKE Header: ispi=0x" << std::hex << initiator_spi
        << " rspi=0x" << responder_spi << std::dec
        << " next=" << static_cast<int>(next_payload)
        << " version=" << static_cast<int>(major_version) << "." << static_cast<int>(minor_version)
        << " exchange=" << static_cast<int>(exchange_type)
        << " flags=0x" << std::hex << static_cast<int>(flags) << std::dec
        << " msgid=" << message_id
        << " length=" << length;
    return oss.str();
}
