#include "EncryptedPayload.h"
#include "ByteReader.h"
#include "PayloadHeader.h"

namespace {
// Integrity, decryption and padding failures all look the same to the caller
const char* const DECRYPTION_FAILED = "Failed to verify or decrypt encrypted payload";
}

std::vector<uint8_t> EncryptedPayload::computeChecksum(const IntegrityMac& integrity_mac,
                                                       const std::vector<uint8_t>& data,
                                                       size_t checksum_len) {
    std::vector<uint8_t> mac = integrity_mac.compute(data);
    if (mac.size() < checksum_len) {
        throw std::invalid_argument("Integrity MAC output shorter than checksum length");
    }
    mac.resize(checksum_len);
    return mac;
}

std::vector<uint8_t> EncryptedPayload::encryptAndEncode(const IKEHeader& header,
                                                        PayloadType first_payload,
                                                        const std::vector<uint8_t>& plaintext,
                                                        const IntegrityMac& integrity_mac,
                                                        size_t checksum_len,
                                                        const IkeCipher& cipher,
                                                        const std::vector<uint8_t>& key) {
    size_t pad_len = paddingLength(plaintext.size(), cipher.getBlockSize());

    std::vector<uint8_t> padded = plaintext;
    appendBytes(padded, IKECrypto::randomBytes(pad_len));
    padded.push_back(static_cast<uint8_t>(pad_len));

    std::vector<uint8_t> iv = cipher.generateIv();
    std::vector<uint8_t> ciphertext = cipher.encrypt(key, iv, padded);

    size_t sk_body_length = iv.size() + ciphertext.size() + checksum_len;
    PayloadHeader sk_header(first_payload, false, sk_body_length);

    std::vector<uint8_t> packet;
    header.withNextPayload(PayloadType::SK)
        .encode(GENERIC_PAYLOAD_HEADER_LENGTH + sk_body_length, packet);
    sk_header.encode(packet);
    appendBytes(packet, iv);
    appendBytes(packet, ciphertext);

    appendBytes(packet, computeChecksum(integrity_mac, packet, checksum_len));
    return packet;
}

DecryptedPayload EncryptedPayload::decode(const std::vector<uint8_t>& packet,
                                          const IntegrityMac& integrity_mac,
                                          size_t checksum_len,
                                          const IkeCipher& cipher,
                                          const std::vector<uint8_t>& key) {
    if (packet.size() < IKE_HEADER_LENGTH) {
        throw IkeSyntaxException("Packet too short for IKE header");
    }
    ByteReader reader(packet.data() + IKE_HEADER_LENGTH, packet.size() - IKE_HEADER_LENGTH);

    PayloadHeader sk_header = PayloadHeader::decode(reader);
    size_t body_length = sk_header.bodyLength();
    if (body_length != reader.remaining()) {
        throw IkeSyntaxException("Encrypted payload must be the last payload and fill the message");
    }

    size_t iv_len = cipher.getIvLength();
    size_t ciphertext_len = checkedBodyLength(static_cast<int>(body_length),
                                              static_cast<int>(iv_len + checksum_len),
                                              "encrypted payload");
    if (ciphertext_len == 0 || ciphertext_len % cipher.getBlockSize() != 0) {
        throw IkeSyntaxException("Encrypted data length " + std::to_string(ciphertext_len)
                                 + " is not a multiple of the block size");
    }

    std::vector<uint8_t> iv = reader.readBytes(iv_len);
    std::vector<uint8_t> ciphertext = reader.readBytes(ciphertext_len);
    std::vector<uint8_t> checksum = reader.readBytes(checksum_len);

    std::vector<uint8_t> authenticated(packet.begin(), packet.end() - checksum_len);
    std::vector<uint8_t> expected = computeChecksum(integrity_mac, authenticated, checksum_len);
    if (!IKECrypto::constantTimeEquals(expected.data(), checksum.data(), checksum_len)) {
        throw IkeCryptoException(DECRYPTION_FAILED);
    }

    std::vector<uint8_t> padded;
    try {
        padded = cipher.decrypt(key, iv, ciphertext);
    } catch (const IkeCryptoException&) {
        throw IkeCryptoException(DECRYPTION_FAILED);
    }

    if (padded.empty()) {
        throw IkeCryptoException(DECRYPTION_FAILED);
    }
    size_t pad_len = padded.back();
    if (pad_len + 1 > padded.size()) {
        throw IkeCryptoException(DECRYPTION_FAILED);
    }
    padded.resize(padded.size() - pad_len - 1);

    return DecryptedPayload{sk_header.next_payload, padded};
}
