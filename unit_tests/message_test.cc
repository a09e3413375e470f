/*
 * message_test.cc
 *
 * payload chains, unsupported payload policy and protected messages
 */

#include "test_helpers.hpp"
#include "IKEMessage.h"
#include "EncryptedPayload.h"

namespace {
std::vector<uint8_t> packetWithBody(PayloadType first, const std::vector<uint8_t>& body,
                                    uint8_t version = 0x20) {
    std::vector<uint8_t> packet;
    testHeader().withNextPayload(first).encode(body.size(), packet);
    packet[17] = version;
    appendBytes(packet, body);
    return packet;
}

DecodeResult decodeUnprotected(const std::vector<uint8_t>& packet) {
    return IKEMessage::decode(IKEHeader::decode(packet), packet);
}

std::vector<IKEPayload> saInitPayloads() {
    return {
        SAPayload::createOutbound({SAPayload::createIkeProposal(
            128, PRFAlgorithm::PRF_HMAC_SHA256, IntegrityAlgorithm::AUTH_HMAC_SHA256_128,
            DHGroup::MODP_2048)}),
        KEPayload::createOutbound(DHGroup::MODP_2048),
        NoncePayload::generate(),
        NotifyPayload(16388, std::vector<uint8_t>(20, 0xee))
    };
}

std::vector<IKEPayload> authPayloads() {
    TrafficSelector any(TrafficSelector::TS_IPV4_ADDR_RANGE, 0, 0, 65535,
                        {0, 0, 0, 0}, {255, 255, 255, 255});
    return {
        IdentityPayload::fqdn(true, "client.example.com"),
        AuthPskPayload(std::vector<uint8_t>(32, 0x61)),
        TrafficSelectorPayload(true, {any}),
        TrafficSelectorPayload(false, {any})
    };
}

struct ProtectionKeys {
    std::vector<uint8_t> integrity_key = std::vector<uint8_t>(20, 0x33);
    std::vector<uint8_t> encryption_key = std::vector<uint8_t>(32, 0x44);
    HmacIntegrity integrity{IntegrityAlgorithm::AUTH_HMAC_SHA1_96, integrity_key};
    AesCbcCipher cipher{256};

    size_t checksumLength() const { return integrity.getChecksumLength(); }
};
}

TEST_CASE("unprotected message round trip") {
    IKEMessage message(testHeader(), saInitPayloads());
    std::vector<uint8_t> packet = message.encode();

    IKEHeader header = IKEHeader::decode(packet);
    CHECK(header.getNextPayload() == PayloadType::SA);
    CHECK(header.getLength() == packet.size());

    DecodeResult result = IKEMessage::decode(header, packet);
    REQUIRE(result.isOk());
    const IKEMessage& decoded = result.getMessage();
    CHECK(decoded.getPayloads() == message.getPayloads());
    REQUIRE(decoded.getPayload<NoncePayload>() != nullptr);
    CHECK(decoded.getPayload<DeletePayload>() == nullptr);
    CHECK(decoded.getPayloadList<NotifyPayload>().size() == 1);
}

TEST_CASE("empty message") {
    IKEMessage message(testHeader(IKEMessageType::INFORMATIONAL), {});
    std::vector<uint8_t> packet = message.encode();
    CHECK(packet.size() == IKE_HEADER_LENGTH);
    CHECK(packet[16] == 0);

    DecodeResult result = decodeUnprotected(packet);
    REQUIRE(result.isOk());
    CHECK(result.getMessage().getPayloads().empty());
}

TEST_CASE("unsupported payloads") {
    std::vector<uint8_t> nonce = std::vector<uint8_t>(16, 0x01);

    SECTION("non-critical payload is dropped") {
        std::vector<uint8_t> body = wrapPayload(PayloadType::V, false, nonce);
        appendBytes(body, wrapPayload(PayloadType::NO_NEXT_PAYLOAD, false, bytesOf("vendor")));

        DecodeResult result = decodeUnprotected(packetWithBody(PayloadType::NONCE, body));
        REQUIRE(result.isOk());
        REQUIRE(result.getMessage().getPayloads().size() == 1);
        CHECK(std::holds_alternative<NoncePayload>(result.getMessage().getPayloads()[0]));
    }

    SECTION("critical payload fails the message") {
        std::vector<uint8_t> body = wrapPayload(static_cast<PayloadType>(47), true, nonce);
        appendBytes(body, wrapPayload(PayloadType::NO_NEXT_PAYLOAD, true, bytesOf("config")));

        DecodeResult result = decodeUnprotected(packetWithBody(PayloadType::NONCE, body));
        CHECK(result.getStatus() == DecodeStatus::UNPROTECTED_ERROR);
        CHECK(result.getErrorCode() == UNSUPPORTED_CRITICAL_PAYLOAD);
        CHECK(result.getUnsupportedPayloads() == std::vector<uint8_t>{47});
        CHECK_THROWS_AS(result.getMessage(), std::logic_error);

        NotifyPayload notify = result.buildErrorNotify();
        CHECK(notify.notify_type == UNSUPPORTED_CRITICAL_PAYLOAD);
        CHECK(notify.notification_data == std::vector<uint8_t>{47});
    }

    SECTION("recognized critical payload next to an unrecognized one") {
        std::vector<uint8_t> body = wrapPayload(static_cast<PayloadType>(47), true, nonce);
        appendBytes(body, wrapPayload(PayloadType::NO_NEXT_PAYLOAD, true, bytesOf("config")));

        DecodeResult result = decodeUnprotected(packetWithBody(PayloadType::NONCE, body));
        CHECK(result.getErrorCode() == UNSUPPORTED_CRITICAL_PAYLOAD);
        CHECK(result.getUnsupportedPayloads() == std::vector<uint8_t>{47});
    }

    SECTION("every critical type is reported") {
        std::vector<uint8_t> body = wrapPayload(PayloadType::CERT, true, bytesOf("eap"));
        appendBytes(body, wrapPayload(PayloadType::NONCE, true, bytesOf("certificate")));
        appendBytes(body, wrapPayload(PayloadType::NO_NEXT_PAYLOAD, false, nonce));

        DecodeResult result = decodeUnprotected(packetWithBody(static_cast<PayloadType>(48), body));
        CHECK(result.getUnsupportedPayloads() == std::vector<uint8_t>{48, 37});
    }

    SECTION("trailing bytes win over critical payloads") {
        std::vector<uint8_t> body = wrapPayload(PayloadType::NO_NEXT_PAYLOAD, true, bytesOf("x"));
        body.push_back(0);

        DecodeResult result = decodeUnprotected(packetWithBody(static_cast<PayloadType>(47), body));
        CHECK(result.getErrorCode() == INVALID_SYNTAX);
        CHECK(result.getUnsupportedPayloads().empty());
    }
}

TEST_CASE("malformed unprotected messages") {
    SECTION("packet shorter than the header") {
        DecodeResult result = IKEMessage::decode(testHeader(), std::vector<uint8_t>());
        CHECK(result.getStatus() == DecodeStatus::UNPROTECTED_ERROR);
        CHECK(result.getErrorCode() == INVALID_SYNTAX);
    }

    SECTION("bytes after the last payload") {
        std::vector<uint8_t> body = wrapPayload(PayloadType::NO_NEXT_PAYLOAD, false,
                                                std::vector<uint8_t>(16, 1));
        body.insert(body.end(), {0, 0, 0});

        DecodeResult result = decodeUnprotected(packetWithBody(PayloadType::NONCE, body));
        CHECK(result.getErrorCode() == INVALID_SYNTAX);
        CHECK(result.getErrorMessage().find("trailing") != std::string::npos);
        CHECK(result.buildErrorNotify().notify_type == INVALID_SYNTAX);
    }

    SECTION("payload length past the end of the message") {
        std::vector<uint8_t> body = hexToBytes("00000040");
        body.resize(20, 1);
        DecodeResult result = decodeUnprotected(packetWithBody(PayloadType::NONCE, body));
        CHECK(result.getErrorCode() == INVALID_SYNTAX);
    }

    SECTION("unsupported major version") {
        DecodeResult result = decodeUnprotected(packetWithBody(PayloadType::NO_NEXT_PAYLOAD, {}, 0x30));
        CHECK(result.getErrorCode() == INVALID_MAJOR_VERSION);

        NotifyPayload notify = result.buildErrorNotify();
        CHECK(notify.notify_type == INVALID_MAJOR_VERSION);
        CHECK(notify.notification_data.empty());
    }

    SECTION("encrypted payload in an unprotected decode") {
        std::vector<uint8_t> body = wrapPayload(PayloadType::NO_NEXT_PAYLOAD, false,
                                                std::vector<uint8_t>(48, 0));
        DecodeResult result = decodeUnprotected(packetWithBody(PayloadType::SK, body));
        CHECK(result.getErrorCode() == INVALID_SYNTAX);
    }

    SECTION("invalid identity fails authentication") {
        std::vector<uint8_t> body = wrapPayload(PayloadType::NO_NEXT_PAYLOAD, false,
                                                hexToBytes("01000000" "0a00"));
        DecodeResult result = decodeUnprotected(packetWithBody(PayloadType::IDi, body));
        CHECK(result.getErrorCode() == AUTHENTICATION_FAILED);
        CHECK(result.buildErrorNotify().notify_type == AUTHENTICATION_FAILED);
    }
}

TEST_CASE("protected message round trip") {
    ProtectionKeys keys;
    IKEMessage message(testHeader(IKEMessageType::IKE_AUTH), authPayloads());

    std::vector<uint8_t> packet = message.encryptAndEncode(keys.integrity, keys.checksumLength(),
                                                           keys.cipher, keys.encryption_key);
    IKEHeader header = IKEHeader::decode(packet);
    CHECK(header.getNextPayload() == PayloadType::SK);

    DecodeResult result = IKEMessage::decode(header, packet, keys.integrity, keys.checksumLength(),
                                             keys.cipher, keys.encryption_key);
    REQUIRE(result.isOk());
    CHECK(result.getMessage().getPayloads() == message.getPayloads());
    CHECK(result.getMessage().getHeader().getNextPayload() == PayloadType::SK);
}

TEST_CASE("protected decode failures") {
    ProtectionKeys keys;

    SECTION("plain payloads are refused") {
        IKEMessage message(testHeader(IKEMessageType::IKE_AUTH), authPayloads());
        std::vector<uint8_t> packet = message.encode();
        DecodeResult result = IKEMessage::decode(IKEHeader::decode(packet), packet, keys.integrity,
                                                 keys.checksumLength(), keys.cipher,
                                                 keys.encryption_key);
        CHECK(result.getStatus() == DecodeStatus::UNPROTECTED_ERROR);
        CHECK(result.getErrorMessage() == "Message contains unprotected payloads");
    }

    SECTION("checksum mismatch has no notify") {
        IKEMessage message(testHeader(IKEMessageType::IKE_AUTH), authPayloads());
        std::vector<uint8_t> packet = message.encryptAndEncode(
            keys.integrity, keys.checksumLength(), keys.cipher, keys.encryption_key);
        packet[packet.size() - 1] ^= 0x01;

        DecodeResult result = IKEMessage::decode(IKEHeader::decode(packet), packet, keys.integrity,
                                                 keys.checksumLength(), keys.cipher,
                                                 keys.encryption_key);
        CHECK(result.getStatus() == DecodeStatus::UNPROTECTED_ERROR);
        CHECK(result.getErrorCode() == 0);
        CHECK_THROWS_AS(result.buildErrorNotify(), std::logic_error);
    }

    SECTION("malformed inner payload after authentication") {
        std::vector<uint8_t> inner = wrapPayload(PayloadType::NO_NEXT_PAYLOAD, false,
                                                 std::vector<uint8_t>(8, 1));
        std::vector<uint8_t> packet = EncryptedPayload::encryptAndEncode(
            testHeader(IKEMessageType::INFORMATIONAL), PayloadType::NONCE, inner, keys.integrity,
            keys.checksumLength(), keys.cipher, keys.encryption_key);

        DecodeResult result = IKEMessage::decode(IKEHeader::decode(packet), packet, keys.integrity,
                                                 keys.checksumLength(), keys.cipher,
                                                 keys.encryption_key);
        CHECK(result.getStatus() == DecodeStatus::PROTECTED_ERROR);
        CHECK(result.getErrorCode() == INVALID_SYNTAX);
    }

    SECTION("nested encrypted payload") {
        std::vector<uint8_t> inner = wrapPayload(PayloadType::NO_NEXT_PAYLOAD, false,
                                                 std::vector<uint8_t>(48, 0));
        std::vector<uint8_t> packet = EncryptedPayload::encryptAndEncode(
            testHeader(IKEMessageType::INFORMATIONAL), PayloadType::SK, inner, keys.integrity,
            keys.checksumLength(), keys.cipher, keys.encryption_key);

        DecodeResult result = IKEMessage::decode(IKEHeader::decode(packet), packet, keys.integrity,
                                                 keys.checksumLength(), keys.cipher,
                                                 keys.encryption_key);
        CHECK(result.getStatus() == DecodeStatus::PROTECTED_ERROR);
        CHECK(result.getErrorCode() == INVALID_SYNTAX);
    }
}

TEST_CASE("single bit flips never decode") {
    ProtectionKeys keys;
    IKEMessage message(testHeader(IKEMessageType::IKE_AUTH), authPayloads());
    const std::vector<uint8_t> packet = message.encryptAndEncode(
        keys.integrity, keys.checksumLength(), keys.cipher, keys.encryption_key);

    for (size_t i = 0; i < packet.size(); ++i) {
        for (int bit = 0; bit < 8; ++bit) {
            std::vector<uint8_t> flipped = packet;
            flipped[i] ^= static_cast<uint8_t>(1 << bit);

            bool decoded = false;
            try {
                IKEHeader header = IKEHeader::decode(flipped);
                decoded = IKEMessage::decode(header, flipped, keys.integrity,
                                             keys.checksumLength(), keys.cipher,
                                             keys.encryption_key).isOk();
            } catch (const IkeException&) {
                decoded = false;
            }
            INFO("byte " << i << " bit " << bit);
            CHECK_FALSE(decoded);
        }
    }
}
