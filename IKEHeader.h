#pragma once
#include "common.h"
#include <vector>

//                          1                   2                   3
//     0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |                       IKE SA Initiator's SPI                  |
//    |                                                               |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |                       IKE SA Responder's SPI                  |
//    |                                                               |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |  Next Payload | MjVer | MnVer | Exchange Type |     Flags     |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |                          Message ID                           |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//    |                            Length                             |
//    +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//
// An IKEHeader is immutable. decode() builds a new value; withNextPayload()
// returns a modified copy.
class IKEHeader {
private:
    uint64_t initiator_spi;
    uint64_t responder_spi;
    PayloadType next_payload;
    uint8_t major_version;
    uint8_t minor_version;
    uint8_t exchange_type;
    uint8_t flags;
    uint32_t message_id;
    uint32_t length;

    IKEHeader(uint64_t ispi, uint64_t rspi, PayloadType next, uint8_t major, uint8_t minor,
              uint8_t exchange, uint8_t header_flags, uint32_t msg_id, uint32_t total_length);

public:
    static constexpr uint8_t MAJOR_VERSION = 2;
    static constexpr uint8_t MINOR_VERSION = 0;

    // Header for an outbound message. The length is filled in by encode().
    IKEHeader(uint64_t ispi, uint64_t rspi, PayloadType next, IKEMessageType exchange,
              bool is_response, bool from_initiator, uint32_t msg_id);

    static IKEHeader decode(const std::vector<uint8_t>& packet);
    static IKEHeader decode(const uint8_t* packet, size_t packet_length);

    // Version and exchange type must be acceptable before any payload is parsed
    void checkInboundValid(size_t packet_length) const;

    void encode(size_t body_length, std::vector<uint8_t>& out) const;

    IKEHeader withNextPayload(PayloadType next) const;

    uint64_t getInitiatorSPI() const { return initiator_spi; }
    uint64_t getResponderSPI() const { return responder_spi; }
    PayloadType getNextPayload() const { return next_payload; }
    uint8_t getMajorVersion() const { return major_version; }
    uint8_t getMinorVersion() const { return minor_version; }
    uint8_t getExchangeType() const { return exchange_type; }
    uint8_t getFlags() const { return flags; }
    uint32_t getMessageId() const { return message_id; }
    uint32_t getLength() const { return length; }

    bool isResponse() const { return (flags & RESPONSE_FLAG) != 0; }
    bool fromIkeInitiator() const { return (flags & INITIATOR_FLAG) != 0; }

    std::string toString() const;
};
