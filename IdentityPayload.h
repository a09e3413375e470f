#pragma once
#include "common.h"
#include "ByteReader.h"
#include <vector>

// IDi / IDr payload: ID Type (1) | RESERVED (3) | Identification Data
class IdentityPayload {
public:
    enum IDType : uint8_t {
        ID_IPV4_ADDR = 1,
        ID_FQDN = 2,
        ID_RFC822_ADDR = 3,
        ID_IPV6_ADDR = 5,
        ID_DER_ASN1_DN = 9,
        ID_KEY_ID = 11
    };

    static constexpr size_t IPV4_ADDR_LEN = 4;
    static constexpr size_t IPV6_ADDR_LEN = 16;

    bool critical;
    bool is_initiator;
    uint8_t id_type;
    std::vector<uint8_t> id_data;

    IdentityPayload(bool initiator, IDType type, const std::vector<uint8_t>& data)
        : critical(false), is_initiator(initiator), id_type(type), id_data(data) {
        validate();
    }

    static IdentityPayload fqdn(bool initiator, const std::string& name) {
        return IdentityPayload(initiator, ID_FQDN, std::vector<uint8_t>(name.begin(), name.end()));
    }

    // A known ID type with well-formed data; anything else cannot be
    // authenticated
    void validate() const {
        switch (id_type) {
            case ID_IPV4_ADDR:
                if (id_data.size() != IPV4_ADDR_LEN) {
                    throw IkeAuthenticationFailedException("Invalid IPv4 identity length");
                }
                break;
            case ID_IPV6_ADDR:
                if (id_data.size() != IPV6_ADDR_LEN) {
                    throw IkeAuthenticationFailedException("Invalid IPv6 identity length");
                }
                break;
            case ID_FQDN:
            case ID_RFC822_ADDR:
            case ID_DER_ASN1_DN:
            case ID_KEY_ID:
                if (id_data.empty()) {
                    throw IkeAuthenticationFailedException("Empty identification data");
                }
                break;
            default:
                throw IkeAuthenticationFailedException("Unsupported ID type: "
                                                       + std::to_string(id_type));
        }
    }

    PayloadType getPayloadType() const {
        return is_initiator ? PayloadType::IDi : PayloadType::IDr;
    }

    void encodeBody(std::vector<uint8_t>& out) const {
        out.push_back(id_type);
        out.push_back(0); // Reserved
        out.push_back(0); // Reserved
        out.push_back(0); // Reserved
        appendBytes(out, id_data);
    }

    // Payload body as signed by the AUTH payload (RESERVED included)
    std::vector<uint8_t> getEncodedBody() const {
        std::vector<uint8_t> body;
        encodeBody(body);
        return body;
    }

    static IdentityPayload decode(bool critical, bool initiator, ByteReader& body) {
        uint8_t type = body.readUint8();
        body.skip(3);
        IdentityPayload id(initiator, static_cast<IDType>(type), body.readRemaining());
        id.critical = critical;
        return id;
    }

    bool operator==(const IdentityPayload& other) const {
        return critical == other.critical && is_initiator == other.is_initiator
            && id_type == other.id_type && id_data == other.id_data;
    }
};
