#pragma once
#include "common.h"
#include "ByteReader.h"
#include "TrafficSelector.h"
#include <vector>

// TSi / TSr payload: Number of TSs (1) | RESERVED (3) | <Traffic Selectors>
class TrafficSelectorPayload {
public:
    bool critical;
    bool is_initiator;
    std::vector<TrafficSelector> traffic_selectors;

    TrafficSelectorPayload(bool initiator, const std::vector<TrafficSelector>& selectors)
        : critical(false), is_initiator(initiator), traffic_selectors(selectors) {
        if (traffic_selectors.empty() || traffic_selectors.size() > 255) {
            throw std::invalid_argument("Traffic selector payload needs 1..255 selectors");
        }
    }

    size_t getNumTs() const { return traffic_selectors.size(); }

    PayloadType getPayloadType() const {
        return is_initiator ? PayloadType::TSi : PayloadType::TSr;
    }

    void encodeBody(std::vector<uint8_t>& out) const {
        out.push_back(static_cast<uint8_t>(traffic_selectors.size()));
        out.push_back(0); // Reserved
        out.push_back(0); // Reserved
        out.push_back(0); // Reserved
        for (const auto& ts : traffic_selectors) {
            ts.encode(out);
        }
    }

    static TrafficSelectorPayload decode(bool critical, bool initiator, ByteReader& body) {
        uint8_t num_ts = body.readUint8();
        body.skip(3);

        if (num_ts == 0) {
            throw IkeSyntaxException("Traffic selector payload carries no selector");
        }

        std::vector<TrafficSelector> selectors;
        for (int i = 0; i < num_ts; i++) {
            selectors.push_back(TrafficSelector::decode(body));
        }
        if (body.hasRemaining()) {
            throw IkeSyntaxException("Unexpected bytes after the last traffic selector");
        }

        TrafficSelectorPayload ts_payload(initiator, selectors);
        ts_payload.critical = critical;
        return ts_payload;
    }

    bool operator==(const TrafficSelectorPayload& other) const {
        return critical == other.critical && is_initiator == other.is_initiator
            && traffic_selectors == other.traffic_selectors;
    }
};
