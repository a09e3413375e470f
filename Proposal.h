#pragma once
#include "common.h"
#include "ByteReader.h"
#include "Transform.h"
#include <vector>

// Proposal substructure of an SA payload (RFC 7296 section 3.3.1)
struct Proposal {
    static constexpr uint8_t LAST_PROPOSAL = 0;
    static constexpr uint8_t NOT_LAST_PROPOSAL = 2;
    static constexpr size_t PROPOSAL_HEADER_LEN = 8;

    static constexpr size_t SPI_LEN_NOT_INCLUDED = 0;
    static constexpr size_t SPI_LEN_IPSEC = 4;
    static constexpr size_t SPI_LEN_IKE = 8;

    uint8_t proposal_num;
    uint8_t protocol_id;
    std::vector<uint8_t> spi;
    std::vector<Transform> transforms;

    Proposal(uint8_t num, ProtocolID protocol, const std::vector<uint8_t>& proposal_spi = {})
        : proposal_num(num), protocol_id(static_cast<uint8_t>(protocol)), spi(proposal_spi) {
        if (spi.size() != SPI_LEN_NOT_INCLUDED && spi.size() != SPI_LEN_IPSEC
            && spi.size() != SPI_LEN_IKE) {
            throw std::invalid_argument("Invalid proposal SPI size: " + std::to_string(spi.size()));
        }
    }

    // Proposals containing unsupported transforms are skipped during
    // negotiation rather than rejected.
    bool hasUnrecognizedTransform() const {
        for (const auto& t : transforms) {
            if (!t.isSupported()) return true;
        }
        return false;
    }

    size_t getProposalLength() const {
        size_t len = PROPOSAL_HEADER_LEN + spi.size();
        for (const auto& t : transforms) {
            len += t.getTransformLength();
        }
        return len;
    }

    void encode(bool is_last, std::vector<uint8_t>& out) const {
        out.push_back(is_last ? LAST_PROPOSAL : NOT_LAST_PROPOSAL);
        out.push_back(0); // Reserved
        appendUint16(out, static_cast<uint16_t>(getProposalLength()));
        out.push_back(proposal_num);
        out.push_back(protocol_id);
        out.push_back(static_cast<uint8_t>(spi.size()));
        out.push_back(static_cast<uint8_t>(transforms.size()));
        appendBytes(out, spi);

        for (size_t i = 0; i < transforms.size(); ++i) {
            transforms[i].encode(i == transforms.size() - 1, out);
        }
    }

    static Proposal decode(ByteReader& reader) {
        uint8_t is_last = reader.readUint8();
        if (is_last != LAST_PROPOSAL && is_last != NOT_LAST_PROPOSAL) {
            throw IkeSyntaxException("Invalid value of Last Proposal Substructure: "
                                     + std::to_string(is_last));
        }
        reader.skip(1);
        uint16_t length = reader.readUint16();
        ByteReader body = reader.slice(checkedBodyLength(length, 4, "Proposal"));

        uint8_t number = body.readUint8();
        uint8_t protocol = body.readUint8();
        uint8_t spi_size = body.readUint8();
        uint8_t num_transforms = body.readUint8();

        if (spi_size != SPI_LEN_NOT_INCLUDED && spi_size != SPI_LEN_IPSEC
            && spi_size != SPI_LEN_IKE) {
            throw IkeSyntaxException("Invalid value of spiSize in Proposal Substructure: "
                                     + std::to_string(spi_size));
        }

        Proposal p(number, static_cast<ProtocolID>(protocol), body.readBytes(spi_size));
        for (int i = 0; i < static_cast<int>(num_transforms); ++i) {
            p.transforms.push_back(Transform::decode(body));
        }

        if (body.hasRemaining()) {
            throw IkeSyntaxException("Proposal length does not match its transforms");
        }
        return p;
    }

    bool operator==(const Proposal& other) const {
        return proposal_num == other.proposal_num && protocol_id == other.protocol_id
            && spi == other.spi && transforms == other.transforms;
    }
};
