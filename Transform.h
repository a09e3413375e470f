#pragma once
#include "common.h"
#include "ByteReader.h"
#include <vector>

// One Transform substructure of an SA proposal (RFC 7296 section 3.3.2).
// Key Length (type 14, TV format) is the only recognized attribute; any other
// attribute marks the transform as unsupported instead of failing the decode.
struct Transform {
    static constexpr uint8_t LAST_TRANSFORM = 0;
    static constexpr uint8_t NOT_LAST_TRANSFORM = 3;
    static constexpr size_t BASIC_TRANSFORM_LEN = 8;

    static constexpr uint16_t ATTRIBUTE_FORMAT_TV = 0x8000;
    static constexpr uint16_t ATTRIBUTE_TYPE_MASK = 0x7fff;
    static constexpr uint16_t ATTRIBUTE_TYPE_KEY_LENGTH = 14;
    static constexpr size_t TV_ATTRIBUTE_LEN = 4;

    uint8_t transform_type;
    uint16_t transform_id;
    uint16_t key_length;            // bits, 0 when not present
    bool has_unrecognized_attribute;

    Transform(TransformType type, uint16_t id, uint16_t key_bits = 0)
        : transform_type(static_cast<uint8_t>(type)), transform_id(id), key_length(key_bits),
          has_unrecognized_attribute(false) {}

    static bool isSupportedTransformId(uint8_t type, uint16_t id) {
        switch (static_cast<TransformType>(type)) {
            case TransformType::ENCR:
                return id == static_cast<uint16_t>(EncryptionAlgorithm::ENCR_3DES)
                    || id == static_cast<uint16_t>(EncryptionAlgorithm::AES_CBC);
            case TransformType::PRF:
                return id == static_cast<uint16_t>(PRFAlgorithm::PRF_HMAC_SHA1)
                    || id == static_cast<uint16_t>(PRFAlgorithm::PRF_HMAC_SHA256);
            case TransformType::INTEG:
                return id == static_cast<uint16_t>(IntegrityAlgorithm::AUTH_HMAC_SHA1_96)
                    || id == static_cast<uint16_t>(IntegrityAlgorithm::AUTH_HMAC_SHA256_128)
                    || id == static_cast<uint16_t>(IntegrityAlgorithm::AUTH_HMAC_SHA384_192)
                    || id == static_cast<uint16_t>(IntegrityAlgorithm::AUTH_HMAC_SHA512_256);
            case TransformType::DH:
                return id == static_cast<uint16_t>(DHGroup::NONE)
                    || id == static_cast<uint16_t>(DHGroup::MODP_1024)
                    || id == static_cast<uint16_t>(DHGroup::MODP_2048);
            case TransformType::ESN:
                return id == 0 || id == 1;
        }
        return false;
    }

    bool isRecognizedType() const {
        return transform_type >= static_cast<uint8_t>(TransformType::ENCR)
            && transform_type <= static_cast<uint8_t>(TransformType::ESN);
    }

    bool isSupported() const {
        if (!isRecognizedType() || has_unrecognized_attribute) return false;
        if (!isSupportedTransformId(transform_type, transform_id)) return false;
        // AES-CBC has a variable key length and MUST carry the attribute
        if (transform_type == static_cast<uint8_t>(TransformType::ENCR)
            && transform_id == static_cast<uint16_t>(EncryptionAlgorithm::AES_CBC)) {
            return key_length == 128 || key_length == 192 || key_length == 256;
        }
        return true;
    }

    size_t getTransformLength() const {
        return BASIC_TRANSFORM_LEN + (key_length != 0 ? TV_ATTRIBUTE_LEN : 0);
    }

    void encode(bool is_last, std::vector<uint8_t>& out) const {
        if (has_unrecognized_attribute) {
            throw std::logic_error("Cannot encode a transform with unrecognized attributes");
        }
        out.push_back(is_last ? LAST_TRANSFORM : NOT_LAST_TRANSFORM);
        out.push_back(0); // Reserved
        appendUint16(out, static_cast<uint16_t>(getTransformLength()));
        out.push_back(transform_type);
        out.push_back(0); // Reserved
        appendUint16(out, transform_id);
        if (key_length != 0) {
            appendUint16(out, ATTRIBUTE_FORMAT_TV | ATTRIBUTE_TYPE_KEY_LENGTH);
            appendUint16(out, key_length);
        }
    }

    static Transform decode(ByteReader& reader) {
        uint8_t is_last = reader.readUint8();
        if (is_last != LAST_TRANSFORM && is_last != NOT_LAST_TRANSFORM) {
            throw IkeSyntaxException("Invalid value of Last Transform Substructure: "
                                     + std::to_string(is_last));
        }
        reader.skip(1);
        uint16_t length = reader.readUint16();
        ByteReader body = reader.slice(checkedBodyLength(length, 4, "Transform"));

        uint8_t type = body.readUint8();
        body.skip(1);
        uint16_t id = body.readUint16();

        Transform t(static_cast<TransformType>(type), id);

        bool seen_key_length = false;
        while (body.hasRemaining()) {
            uint16_t format_and_type = body.readUint16();
            uint16_t attr_type = format_and_type & ATTRIBUTE_TYPE_MASK;

            if (format_and_type & ATTRIBUTE_FORMAT_TV) {
                uint16_t value = body.readUint16();
                if (attr_type == ATTRIBUTE_TYPE_KEY_LENGTH) {
                    if (seen_key_length) {
                        throw IkeSyntaxException("There are multiple Attributes of the same type");
                    }
                    seen_key_length = true;
                    t.key_length = value;
                } else {
                    t.has_unrecognized_attribute = true;
                }
            } else {
                if (attr_type == ATTRIBUTE_TYPE_KEY_LENGTH) {
                    throw IkeSyntaxException("Wrong format in Transform Attribute");
                }
                uint16_t value_length = body.readUint16();
                body.skip(value_length);
                t.has_unrecognized_attribute = true;
            }
        }
        return t;
    }

    bool operator==(const Transform& other) const {
        return transform_type == other.transform_type && transform_id == other.transform_id
            && key_length == other.key_length
            && has_unrecognized_attribute == other.has_unrecognized_attribute;
    }
};
