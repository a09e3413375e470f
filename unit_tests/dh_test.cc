/*
 * dh_test.cc
 *
 * MODP key pairs and shared secret agreement
 */

#include "test_helpers.hpp"
#include "DHKeyExchange.h"
#include "KEPayload.h"
#include <algorithm>

TEST_CASE("both sides compute the same shared secret") {
    DHGroup group = GENERATE(DHGroup::MODP_1024, DHGroup::MODP_2048);

    auto initiator = DHKeyExchange::generate(group);
    auto responder = DHKeyExchange::generate(group);

    std::vector<uint8_t> initiator_public = initiator->getPublicKey();
    std::vector<uint8_t> responder_public = responder->getPublicKey();
    CHECK(initiator_public.size() == initiator->getKeyLength());
    CHECK(initiator_public != responder_public);

    std::vector<uint8_t> secret_i = initiator->computeSharedSecret(responder_public);
    std::vector<uint8_t> secret_r = responder->computeSharedSecret(initiator_public);
    CHECK(secret_i == secret_r);
    CHECK(secret_i.size() == initiator->getKeyLength());
}

TEST_CASE("public value is zero padded to the group length") {
    // g^1 mod p == 2
    auto key_pair = DHKeyExchange::fromPrivateKey(DHGroup::MODP_1024, {0x01});
    std::vector<uint8_t> pub = key_pair->getPublicKey();

    REQUIRE(pub.size() == 128);
    CHECK(pub.back() == 0x02);
    CHECK(std::all_of(pub.begin(), pub.end() - 1, [](uint8_t b) { return b == 0; }));
}

TEST_CASE("shared secret with known private values") {
    // 2^2 and 2^3 give the secret 2^6 == 64
    auto a = DHKeyExchange::fromPrivateKey(DHGroup::MODP_2048, {0x02});
    auto b = DHKeyExchange::fromPrivateKey(DHGroup::MODP_2048, {0x03});

    std::vector<uint8_t> secret = a->computeSharedSecret(b->getPublicKey());
    REQUIRE(secret.size() == 256);
    CHECK(secret.back() == 64);
    CHECK(std::all_of(secret.begin(), secret.end() - 1, [](uint8_t x) { return x == 0; }));
}

TEST_CASE("private key is single use") {
    auto local = DHKeyExchange::generate(DHGroup::MODP_1024);
    auto peer = DHKeyExchange::generate(DHGroup::MODP_1024);
    std::vector<uint8_t> peer_public = peer->getPublicKey();

    CHECK_FALSE(local->isConsumed());
    CHECK_NOTHROW(local->computeSharedSecret(peer_public));
    CHECK(local->isConsumed());
    CHECK_THROWS_AS(local->computeSharedSecret(peer_public), IkeCryptoException);
    CHECK_THROWS_AS(local->getPublicKey(), std::logic_error);
}

TEST_CASE("peer public value with wrong length") {
    auto local = DHKeyExchange::generate(DHGroup::MODP_1024);
    CHECK_THROWS_AS(local->computeSharedSecret(std::vector<uint8_t>(127, 1)), IkeCryptoException);
}

TEST_CASE("unsupported DH group") {
    CHECK_FALSE(DHKeyExchange::isSupportedGroup(5));
    CHECK(DHKeyExchange::isSupportedGroup(14));
    CHECK_THROWS_AS(DHKeyExchange::generate(DHGroup::NONE), IkeCryptoException);
    CHECK_THROWS_AS(KEPayload::createOutbound(static_cast<DHGroup>(5)), IkeCryptoException);
}

TEST_CASE("KE payload releases its key after agreement") {
    KEPayload local = KEPayload::createOutbound(DHGroup::MODP_1024);
    KEPayload remote = KEPayload::createOutbound(DHGroup::MODP_1024);
    REQUIRE(local.local_key);

    std::vector<uint8_t> secret_local = local.computeSharedSecret(remote.key_exchange_data);
    std::vector<uint8_t> secret_remote = remote.computeSharedSecret(local.key_exchange_data);
    CHECK(secret_local == secret_remote);

    CHECK_FALSE(local.local_key);
    CHECK_THROWS_AS(local.computeSharedSecret(remote.key_exchange_data), std::logic_error);
}
