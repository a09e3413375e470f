#pragma once
#include "common.h"
#include "IKEHeader.h"
#include "IKECrypto.h"
#include <vector>

// SK payload (RFC 7296 section 3.14):
//
//    Next Payload | C | RESERVED | Payload Length
//    Initialization Vector
//    Encrypted IKE Payloads || Padding || Pad Length
//    Integrity Checksum Data
//
// The Next Payload field of the SK header names the first inner payload. The
// checksum covers everything from the start of the IKE header up to the end
// of the ciphertext.
struct DecryptedPayload {
    PayloadType first_payload;
    std::vector<uint8_t> plaintext;
};

class EncryptedPayload {
public:
    // Builds a complete protected message: IKE header (next payload SK),
    // SK generic header, IV, ciphertext and checksum.
    static std::vector<uint8_t> encryptAndEncode(const IKEHeader& header,
                                                 PayloadType first_payload,
                                                 const std::vector<uint8_t>& plaintext,
                                                 const IntegrityMac& integrity_mac,
                                                 size_t checksum_len,
                                                 const IkeCipher& cipher,
                                                 const std::vector<uint8_t>& key);

    // packet is the complete IKE message whose header names SK as the first
    // payload. The checksum is verified before anything is decrypted.
    static DecryptedPayload decode(const std::vector<uint8_t>& packet,
                                   const IntegrityMac& integrity_mac,
                                   size_t checksum_len,
                                   const IkeCipher& cipher,
                                   const std::vector<uint8_t>& key);

    // Number of padding bytes so that data + padding + pad length byte fills
    // whole cipher blocks
    static size_t paddingLength(size_t data_length, size_t block_size) {
        return (block_size - (data_length + 1) % block_size) % block_size;
    }

private:
    static std::vector<uint8_t> computeChecksum(const IntegrityMac& integrity_mac,
                                                const std::vector<uint8_t>& data,
                                                size_t checksum_len);
};
