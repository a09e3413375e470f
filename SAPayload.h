#pragma once
#include "common.h"
#include "ByteReader.h"
#include "Proposal.h"
#include <vector>

class SAPayload {
public:
    bool critical;
    std::vector<Proposal> proposals;

    SAPayload() : critical(false) {}

    // Outbound SA payload. Proposal numbers are assigned starting from 1 in
    // list order.
    static SAPayload createOutbound(const std::vector<Proposal>& proposal_list) {
        if (proposal_list.empty() || proposal_list.size() > 255) {
            throw std::invalid_argument("Invalid SA payload: need 1..255 proposals");
        }
        SAPayload sa;
        for (size_t i = 0; i < proposal_list.size(); ++i) {
            Proposal p = proposal_list[i];
            p.proposal_num = static_cast<uint8_t>(i + 1);
            sa.proposals.push_back(p);
        }
        return sa;
    }

    static Proposal createIkeProposal(int aes_key_bits, PRFAlgorithm prf,
                                      IntegrityAlgorithm integ, DHGroup group) {
        Proposal ike_proposal(1, ProtocolID::IKE);
        ike_proposal.transforms.push_back(Transform(TransformType::ENCR,
            static_cast<uint16_t>(EncryptionAlgorithm::AES_CBC), static_cast<uint16_t>(aes_key_bits)));
        ike_proposal.transforms.push_back(Transform(TransformType::PRF, static_cast<uint16_t>(prf)));
        ike_proposal.transforms.push_back(Transform(TransformType::INTEG, static_cast<uint16_t>(integ)));
        ike_proposal.transforms.push_back(Transform(TransformType::DH, static_cast<uint16_t>(group)));
        return ike_proposal;
    }

    PayloadType getPayloadType() const { return PayloadType::SA; }

    void encodeBody(std::vector<uint8_t>& out) const {
        for (size_t i = 0; i < proposals.size(); ++i) {
            proposals[i].encode(i == proposals.size() - 1, out);
        }
    }

    static SAPayload decode(bool critical, bool is_response, ByteReader& body) {
        SAPayload sa;
        sa.critical = critical;
        while (body.hasRemaining()) {
            sa.proposals.push_back(Proposal::decode(body));
        }

        if (sa.proposals.empty()) {
            throw IkeSyntaxException("SA payload carries no proposal");
        }
        // An SA response must have exactly one SA proposal
        if (is_response && sa.proposals.size() != 1) {
            throw IkeSyntaxException("Expected only one negotiated proposal from SA response: "
                                     "multiple negotiated proposals found");
        }
        return sa;
    }

    bool operator==(const SAPayload& other) const {
        return critical == other.critical && proposals == other.proposals;
    }
};
