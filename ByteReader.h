#pragma once
#include "common.h"
#include <cstring>

// Bounds-checked cursor over a received buffer. Every read that would run past
// the end raises IkeSyntaxException, so malformed length fields coming from the
// peer can never turn into an out-of-range access.
class ByteReader {
private:
    const uint8_t* data;
    const uint8_t* data_end;

    void require(size_t num_bytes, const char* what) const {
        if (remaining() < num_bytes) {
            throw IkeSyntaxException(std::string("Truncated ") + what + ": need "
                                     + std::to_string(num_bytes) + " bytes, "
                                     + std::to_string(remaining()) + " remaining");
        }
    }

public:
    ByteReader(const uint8_t* first, size_t length) : data(first), data_end(first + length) {}

    explicit ByteReader(const std::vector<uint8_t>& buffer)
        : data(buffer.data()), data_end(buffer.data() + buffer.size()) {}

    size_t remaining() const { return static_cast<size_t>(data_end - data); }
    bool hasRemaining() const { return data < data_end; }
    const uint8_t* position() const { return data; }

    uint8_t readUint8() {
        require(1, "uint8");
        return *data++;
    }

    uint16_t readUint16() {
        require(2, "uint16");
        uint16_t value = (static_cast<uint16_t>(data[0]) << 8) | data[1];
        data += 2;
        return value;
    }

    uint32_t readUint32() {
        require(4, "uint32");
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value = (value << 8) | data[i];
        }
        data += 4;
        return value;
    }

    uint64_t readUint64() {
        require(8, "uint64");
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value = (value << 8) | data[i];
        }
        data += 8;
        return value;
    }

    std::vector<uint8_t> readBytes(size_t num_bytes) {
        require(num_bytes, "field");
        std::vector<uint8_t> out(data, data + num_bytes);
        data += num_bytes;
        return out;
    }

    std::vector<uint8_t> readRemaining() {
        return readBytes(remaining());
    }

    // Returns a reader over the next num_bytes and advances past them
    ByteReader slice(size_t num_bytes) {
        require(num_bytes, "substructure");
        ByteReader sub(data, num_bytes);
        data += num_bytes;
        return sub;
    }

    void skip(size_t num_bytes) {
        require(num_bytes, "reserved field");
        data += num_bytes;
    }
};

// Converts a declared length minus a fixed overhead to a body length, failing
// with a syntax error when the declared value is too small.
inline size_t checkedBodyLength(int declared_length, int overhead, const char* what) {
    int body_length = declared_length - overhead;
    if (body_length < 0) {
        throw IkeSyntaxException(std::string("Invalid ") + what + " length: "
                                 + std::to_string(declared_length));
    }
    return static_cast<size_t>(body_length);
}
