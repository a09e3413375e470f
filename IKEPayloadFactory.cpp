#include "IKEPayloadFactory.h"

std::pair<IKEPayload, PayloadType> IKEPayloadFactory::decodeNext(PayloadType type, bool is_response,
                                                                 ByteReader& reader) {
    PayloadHeader header = PayloadHeader::decode(reader);
    ByteReader body = reader.slice(header.bodyLength());

    IKEPayload payload = decodeBody(type, header.critical, is_response, body);
    return std::make_pair(std::move(payload), header.next_payload);
}

IKEPayload IKEPayloadFactory::decodeBody(PayloadType type, bool critical, bool is_response,
                                         ByteReader& body) {
    switch (type) {
        case PayloadType::SA:
            return SAPayload::decode(critical, is_response, body);
        case PayloadType::KE:
            return KEPayload::decode(critical, body);
        case PayloadType::IDi:
            return IdentityPayload::decode(critical, true, body);
        case PayloadType::IDr:
            return IdentityPayload::decode(critical, false, body);
        case PayloadType::AUTH:
            return decodeAuth(critical, body);
        case PayloadType::NONCE:
            return NoncePayload::decode(critical, body);
        case PayloadType::N:
            return NotifyPayload::decode(critical, body);
        case PayloadType::D:
            return DeletePayload::decode(critical, body);
        case PayloadType::TSi:
            return TrafficSelectorPayload::decode(critical, true, body);
        case PayloadType::TSr:
            return TrafficSelectorPayload::decode(critical, false, body);
        case PayloadType::SK:
            throw IkeSyntaxException("Encrypted payload cannot appear inside a payload list");
        default:
            return UnsupportedPayload(static_cast<uint8_t>(type), critical);
    }
}

// AUTH payloads always take part in authentication, so an unknown method is a
// failure rather than an ignorable payload.
IKEPayload IKEPayloadFactory::decodeAuth(bool critical, ByteReader& body) {
    uint8_t method = body.readUint8();
    body.skip(3);

    switch (method) {
        case SHARED_KEY_MESSAGE_INTEGRITY_CODE:
            return AuthPskPayload::decode(critical, body);
        case RSA_DIGITAL_SIGNATURE:
        case GENERIC_DIGITAL_SIGNATURE:
            return AuthDigitalSignPayload::decode(critical, static_cast<AuthMethod>(method), body);
        default:
            throw IkeAuthenticationFailedException("Unsupported authentication method: "
                                                   + std::to_string(method));
    }
}
