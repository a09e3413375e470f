#include "IKEMessage.h"
#include "IKEPayloadFactory.h"
#include "EncryptedPayload.h"
#include "ByteReader.h"

std::vector<uint8_t> IKEMessage::encodePayloadList(const std::vector<IKEPayload>& payload_list) {
    std::vector<uint8_t> out;
    for (size_t i = 0; i < payload_list.size(); ++i) {
        PayloadType next = (i + 1 < payload_list.size()) ? getPayloadType(payload_list[i + 1])
                                                         : PayloadType::NO_NEXT_PAYLOAD;
        encodePayload(payload_list[i], next, out);
    }
    return out;
}

static PayloadType firstPayloadType(const std::vector<IKEPayload>& payload_list) {
    return payload_list.empty() ? PayloadType::NO_NEXT_PAYLOAD : getPayloadType(payload_list[0]);
}

std::vector<uint8_t> IKEMessage::encode() const {
    std::vector<uint8_t> body = encodePayloadList(payloads);

    std::vector<uint8_t> packet;
    header.withNextPayload(firstPayloadType(payloads)).encode(body.size(), packet);
    appendBytes(packet, body);
    return packet;
}

std::vector<uint8_t> IKEMessage::encryptAndEncode(const IntegrityMac& integrity_mac,
                                                  size_t checksum_len, const IkeCipher& cipher,
                                                  const std::vector<uint8_t>& key) const {
    return EncryptedPayload::encryptAndEncode(header, firstPayloadType(payloads),
                                              encodePayloadList(payloads), integrity_mac,
                                              checksum_len, cipher, key);
}

std::vector<IKEPayload> IKEMessage::decodePayloadList(PayloadType first_payload, bool is_response,
                                                      const uint8_t* data, size_t length) {
    ByteReader reader(data, length);
    std::vector<IKEPayload> supported;
    std::vector<uint8_t> unsupported_critical;

    PayloadType current = first_payload;
    while (current != PayloadType::NO_NEXT_PAYLOAD) {
        auto decoded = IKEPayloadFactory::decodeNext(current, is_response, reader);

        if (const auto* unsupported = std::get_if<UnsupportedPayload>(&decoded.first)) {
            if (unsupported->critical) {
                unsupported_critical.push_back(unsupported->payload_type);
            }
        } else {
            supported.push_back(std::move(decoded.first));
        }
        current = decoded.second;
    }

    if (reader.hasRemaining()) {
        throw IkeSyntaxException("Unexpected trailing bytes after the last payload: "
                                 + std::to_string(reader.remaining()));
    }
    if (!unsupported_critical.empty()) {
        throw IkeUnsupportedCriticalPayloadException(unsupported_critical);
    }
    return supported;
}

DecodeResult IKEMessage::decode(const IKEHeader& header, const std::vector<uint8_t>& packet) {
    try {
        header.checkInboundValid(packet.size());
        std::vector<IKEPayload> payload_list =
            decodePayloadList(header.getNextPayload(), header.isResponse(),
                              packet.data() + IKE_HEADER_LENGTH,
                              packet.size() - IKE_HEADER_LENGTH);
        return DecodeResult::ok(IKEMessage(header, payload_list));
    } catch (const IkeException& e) {
        return DecodeResult::error(DecodeStatus::UNPROTECTED_ERROR, e);
    }
}

DecodeResult IKEMessage::decode(const IKEHeader& header, const std::vector<uint8_t>& packet,
                                const IntegrityMac& integrity_mac, size_t checksum_len,
                                const IkeCipher& cipher, const std::vector<uint8_t>& key) {
    DecryptedPayload decrypted;
    try {
        header.checkInboundValid(packet.size());
        if (header.getNextPayload() != PayloadType::SK) {
            throw IkeSyntaxException("Message contains unprotected payloads");
        }
        decrypted = EncryptedPayload::decode(packet, integrity_mac, checksum_len, cipher, key);
    } catch (const IkeException& e) {
        return DecodeResult::error(DecodeStatus::UNPROTECTED_ERROR, e);
    }

    try {
        std::vector<IKEPayload> payload_list =
            decodePayloadList(decrypted.first_payload, header.isResponse(),
                              decrypted.plaintext.data(), decrypted.plaintext.size());
        return DecodeResult::ok(IKEMessage(header, payload_list));
    } catch (const IkeException& e) {
        return DecodeResult::error(DecodeStatus::PROTECTED_ERROR, e);
    }
}

DecodeResult DecodeResult::error(DecodeStatus s, const IkeException& e) {
    if (s == DecodeStatus::OK) {
        throw std::logic_error("Error result needs an error status");
    }
    std::vector<uint8_t> unsupported;
    if (const auto* critical = dynamic_cast<const IkeUnsupportedCriticalPayloadException*>(&e)) {
        unsupported = critical->getPayloadTypes();
    }
    return DecodeResult(s, std::nullopt, e.errorCode(), e.what(), unsupported);
}

const IKEMessage& DecodeResult::getMessage() const {
    if (!message) {
        throw std::logic_error("No message in failed decode: " + error_message);
    }
    return *message;
}

NotifyPayload DecodeResult::buildErrorNotify() const {
    switch (error_code) {
        case UNSUPPORTED_CRITICAL_PAYLOAD:
            return NotifyPayload::unsupportedCriticalPayload(unsupported_payloads.front());
        case INVALID_MAJOR_VERSION:
        case INVALID_SYNTAX:
        case AUTHENTICATION_FAILED:
            return NotifyPayload(error_code);
        default:
            throw std::logic_error("Decode result has no notify error to report");
    }
}
