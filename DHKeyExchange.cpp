#include "DHKeyExchange.h"

namespace {

// MODP 1024-bit group (RFC 2409 section 6.2)
const char modp1024_p[] =
    "FFFFFFFFFFFFFFFFC90FDAA22168C234C4C6628B80DC1CD1"
    "29024E088A67CC74020BBEA63B139B22514A08798E3404DD"
    "EF9519B3CD3A431B302B0A6DF25F14374FE1356D6D51C245"
    "E485B576625E7EC6F44C42E9A637ED6B0BFF5CB6F406B7ED"
    "EE386BFB5A899FA5AE9F24117C4B1FE649286651ECE65381"
    "FFFFFFFFFFFFFFFF";

// MODP 2048-bit group (RFC 3526 section 3)
const char modp2048_p[] =
    "FFFFFFFFFFFFFFFFC90FDAA22168C234C4C6628B80DC1CD1"
    "29024E088A67CC74020BBEA63B139B22514A08798E3404DD"
    "EF9519B3CD3A431B302B0A6DF25F14374FE1356D6D51C245"
    "E485B576625E7EC6F44C42E9A637ED6B0BFF5CB6F406B7ED"
    "EE386BFB5A899FA5AE9F24117C4B1FE649286651ECE45B3D"
    "C2007CB8A163BF0598DA48361C55D39A69163FA8FD24CF5F"
    "83655D23DCA3AD961C62F356208552BB9ED529077096966D"
    "670C354E4ABC9804F1746C08CA18217C32905E462E36CE3B"
    "E39E772C180E86039B2783A2EC07A28FB5C55DF06F4C52C9"
    "DE2BCBF6955817183995497CEA956AE515D2261898FA0510"
    "15728E5A8AACAA68FFFFFFFFFFFFFFFF";

const DHGroupParams supported_groups[] = {
    { DHGroup::MODP_1024, modp1024_p, "2", 128 },
    { DHGroup::MODP_2048, modp2048_p, "2", 256 },
};

struct BignumDeleter {
    void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
};
using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;

} // namespace

const DHGroupParams* DHKeyExchange::findGroup(uint16_t group_id) {
    for (const auto& params : supported_groups) {
        if (static_cast<uint16_t>(params.group) == group_id) {
            return &params;
        }
    }
    return nullptr;
}

DHKeyExchange::DHKeyExchange(const DHGroupParams& params)
    : dh(nullptr), group(params.group), key_length(params.public_value_length), consumed(false) {
    initializeDH(params);
}

DHKeyExchange::~DHKeyExchange() {
    if (dh) DH_free(dh);
}

void DHKeyExchange::initializeDH(const DHGroupParams& params) {
    dh = DH_new();
    CHECK_OPENSSL(dh);

    BIGNUM* p = nullptr;
    BIGNUM* g = nullptr;
    if (!BN_hex2bn(&p, params.prime_hex) || !BN_dec2bn(&g, params.generator)) {
        BN_free(p);
        BN_free(g);
        CHECK_OPENSSL(false);
    }
    if (!DH_set0_pqg(dh, p, nullptr, g)) {
        BN_free(p);
        BN_free(g);
        CHECK_OPENSSL(false);
    }
}

std::unique_ptr<DHKeyExchange> DHKeyExchange::generate(DHGroup group) {
    const DHGroupParams* params = findGroup(static_cast<uint16_t>(group));
    if (!params) {
        throw IkeCryptoException("Unsupported DH group: "
                                 + std::to_string(static_cast<int>(group)));
    }

    std::unique_ptr<DHKeyExchange> key_pair(new DHKeyExchange(*params));
    CHECK_OPENSSL(DH_generate_key(key_pair->dh));
    return key_pair;
}

std::unique_ptr<DHKeyExchange> DHKeyExchange::fromPrivateKey(
        DHGroup group, const std::vector<uint8_t>& private_key) {
    const DHGroupParams* params = findGroup(static_cast<uint16_t>(group));
    if (!params) {
        throw IkeCryptoException("Unsupported DH group: "
                                 + std::to_string(static_cast<int>(group)));
    }

    std::unique_ptr<DHKeyExchange> key_pair(new DHKeyExchange(*params));

    const BIGNUM* p = nullptr;
    const BIGNUM* g = nullptr;
    DH_get0_pqg(key_pair->dh, &p, nullptr, &g);

    BignumPtr priv(BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()), nullptr));
    BignumPtr pub(BN_new());
    std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)> ctx(BN_CTX_new(), &BN_CTX_free);
    CHECK_OPENSSL(priv && pub && ctx);
    CHECK_OPENSSL(BN_mod_exp(pub.get(), g, priv.get(), p, ctx.get()));

    CHECK_OPENSSL(DH_set0_key(key_pair->dh, pub.get(), priv.get()));
    pub.release();
    priv.release();
    return key_pair;
}

std::vector<uint8_t> DHKeyExchange::getPublicKey() const {
    if (!dh) {
        throw std::logic_error("DH key pair has been discarded");
    }
    const BIGNUM* pub_key = nullptr;
    DH_get0_key(dh, &pub_key, nullptr);
    if (!pub_key) {
        throw std::logic_error("DH key pair has no public value");
    }

    // Leading zero bytes are part of the fixed-length encoding
    std::vector<uint8_t> key_data(key_length);
    CHECK_OPENSSL(BN_bn2binpad(pub_key, key_data.data(), static_cast<int>(key_data.size()))
                  == static_cast<int>(key_length));
    return key_data;
}

std::vector<uint8_t> DHKeyExchange::computeSharedSecret(const std::vector<uint8_t>& peer_public_key) {
    if (consumed) {
        throw IkeCryptoException("DH private key has already been used");
    }
    if (peer_public_key.size() != key_length) {
        throw IkeCryptoException("Peer public value has invalid length: "
                                 + std::to_string(peer_public_key.size()));
    }

    BignumPtr peer_key(BN_bin2bn(peer_public_key.data(),
                                 static_cast<int>(peer_public_key.size()), nullptr));
    CHECK_OPENSSL(peer_key);

    std::vector<uint8_t> shared_secret(DH_size(dh));
    int result = DH_compute_key_padded(shared_secret.data(), peer_key.get(), dh);

    // The private key is single use whether or not the agreement succeeded
    consumed = true;
    DH_free(dh);
    dh = nullptr;

    if (result < 0) {
        throw IkeCryptoException("DH shared secret computation failed");
    }

    shared_secret.resize(result);
    return shared_secret;
}
