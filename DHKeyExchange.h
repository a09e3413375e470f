#pragma once
#include "common.h"
#include <vector>
#include <memory>
#include <openssl/dh.h>
#include <openssl/bn.h>

// Parameters of one MODP group. New groups are added as entries in the table
// in DHKeyExchange.cpp.
struct DHGroupParams {
    DHGroup group;
    const char* prime_hex;
    const char* generator;
    size_t public_value_length;
};

// Ephemeral Diffie-Hellman key pair for one outbound KE payload. The private
// key never leaves this object and is released after the shared secret has
// been computed once.
class DHKeyExchange {
private:
    DH* dh;
    DHGroup group;
    size_t key_length;
    bool consumed;

    explicit DHKeyExchange(const DHGroupParams& params);

    void initializeDH(const DHGroupParams& params);

public:
    static const DHGroupParams* findGroup(uint16_t group_id);
    static bool isSupportedGroup(uint16_t group_id) { return findGroup(group_id) != nullptr; }

    // Throws IkeCryptoException for groups without parameters
    static std::unique_ptr<DHKeyExchange> generate(DHGroup group);

    // Key pair with a caller-chosen private value, big-endian
    static std::unique_ptr<DHKeyExchange> fromPrivateKey(DHGroup group,
                                                         const std::vector<uint8_t>& private_key);

    ~DHKeyExchange();

    DHKeyExchange(const DHKeyExchange&) = delete;
    DHKeyExchange& operator=(const DHKeyExchange&) = delete;

    // Zero-padded to the group's public value length
    std::vector<uint8_t> getPublicKey() const;

    std::vector<uint8_t> computeSharedSecret(const std::vector<uint8_t>& peer_public_key);

    DHGroup getGroup() const { return group; }
    size_t getKeyLength() const { return key_length; }
    bool isConsumed() const { return consumed; }
};
