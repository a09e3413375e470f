#pragma once
#include "common.h"
#include "ByteReader.h"
#include <vector>

// One Traffic Selector substructure (RFC 7296 section 3.13.1)
struct TrafficSelector {
    static constexpr uint8_t TS_IPV4_ADDR_RANGE = 7;
    static constexpr uint8_t TS_IPV6_ADDR_RANGE = 8;
    static constexpr size_t TS_HEADER_LEN = 8;
    static constexpr size_t IPV4_SELECTOR_LEN = 16;
    static constexpr size_t IPV6_SELECTOR_LEN = 40;

    uint8_t ts_type;
    uint8_t ip_protocol_id;
    uint16_t start_port;
    uint16_t end_port;
    std::vector<uint8_t> starting_address;
    std::vector<uint8_t> ending_address;

    TrafficSelector(uint8_t type, uint8_t protocol, uint16_t port_start, uint16_t port_end,
                    const std::vector<uint8_t>& addr_start, const std::vector<uint8_t>& addr_end)
        : ts_type(type), ip_protocol_id(protocol), start_port(port_start), end_port(port_end),
          starting_address(addr_start), ending_address(addr_end) {
        size_t addr_len = addressLength(type);
        if (addr_len == 0) {
            throw std::invalid_argument("Unsupported traffic selector type: " + std::to_string(type));
        }
        if (starting_address.size() != addr_len || ending_address.size() != addr_len) {
            throw std::invalid_argument("Traffic selector address length does not match its type");
        }
    }

    static size_t addressLength(uint8_t type) {
        switch (type) {
            case TS_IPV4_ADDR_RANGE: return 4;
            case TS_IPV6_ADDR_RANGE: return 16;
            default: return 0;
        }
    }

    size_t getSelectorLength() const {
        return TS_HEADER_LEN + 2 * starting_address.size();
    }

    // Addresses compare as big-endian byte strings; protocol 0 and the full
    // port range act as wildcards
    bool contains(const std::vector<uint8_t>& address, uint16_t port, uint8_t protocol) const {
        if (address.size() != starting_address.size()) return false;
        if (address < starting_address || address > ending_address) return false;
        if (ip_protocol_id != 0 && ip_protocol_id != protocol) return false;
        return port >= start_port && port <= end_port;
    }

    void encode(std::vector<uint8_t>& out) const {
        out.push_back(ts_type);
        out.push_back(ip_protocol_id);
        appendUint16(out, static_cast<uint16_t>(getSelectorLength()));
        appendUint16(out, start_port);
        appendUint16(out, end_port);
        appendBytes(out, starting_address);
        appendBytes(out, ending_address);
    }

    static TrafficSelector decode(ByteReader& reader) {
        uint8_t type = reader.readUint8();
        uint8_t protocol = reader.readUint8();
        uint16_t selector_length = reader.readUint16();

        size_t addr_len = addressLength(type);
        if (addr_len == 0) {
            throw IkeSyntaxException("Invalid Traffic Selector type: " + std::to_string(type));
        }
        if (selector_length != TS_HEADER_LEN + 2 * addr_len) {
            throw IkeSyntaxException("Invalid Traffic Selector length: "
                                     + std::to_string(selector_length));
        }

        uint16_t port_start = reader.readUint16();
        uint16_t port_end = reader.readUint16();
        std::vector<uint8_t> addr_start = reader.readBytes(addr_len);
        std::vector<uint8_t> addr_end = reader.readBytes(addr_len);

        if (port_start > port_end) {
            throw IkeSyntaxException("Traffic Selector start port exceeds end port");
        }
        if (addr_start > addr_end) {
            throw IkeSyntaxException("Traffic Selector start address exceeds end address");
        }
        return TrafficSelector(type, protocol, port_start, port_end, addr_start, addr_end);
    }

    bool operator==(const TrafficSelector& other) const {
        return ts_type == other.ts_type && ip_protocol_id == other.ip_protocol_id
            && start_port == other.start_port && end_port == other.end_port
            && starting_address == other.starting_address
            && ending_address == other.ending_address;
    }
};
