#include <unordered_map>
#include <openssl/evp.h>
#include <openssl/core_names.h>
#include <openssl/params.h>

#include <casket/utils/exception.hpp>

#include <tlsh/crypto/crypto_manager.hpp>
#include <tlsh/crypto/group_params.hpp>
#include <tlsh/crypto/pointers.hpp>
#include <tlsh/crypto/exception.hpp>

namespace tlsh::crypto
{

struct GroupParamInfo
{
    const char* algorithm{nullptr};
    const char* groupName{nullptr};
};

// clang-format off
static const std::unordered_map<uint16_t, GroupParamInfo> gGroupParams{
    {GroupParams::SECP256R1, {"EC", SN_X9_62_prime256v1}},
    {GroupParams::SECP384R1, {"EC", SN_secp384r1}},
    {GroupParams::SECP521R1, {"EC", SN_secp521r1}},
    {GroupParams::X25519, {"X25519", nullptr}},
};
// clang-format on

static const GroupParamInfo& FindGroupParams(const GroupParams groupParams)
{
    auto param = gGroupParams.find(groupParams.wireCode());
    casket::ThrowIfTrue(param == gGroupParams.end(), "Unsupported group parameters");
    return param->second;
}

const std::vector<GroupParams>& GroupParams::getSupported()
{
    static std::vector<GroupParams> gSupportedGroups =
    {
        GroupParams(GroupParams::X25519),
        GroupParams(GroupParams::SECP256R1),
        GroupParams(GroupParams::SECP384R1),
        GroupParams(GroupParams::SECP521R1),
    };
    return gSupportedGroups;
}

const char* GroupParams::toString() const
{
    switch (code_)
    {
    case GroupParams::Code::SECP256R1:
        return "secp256r1";
    case GroupParams::Code::SECP384R1:
        return "secp384r1";
    case GroupParams::Code::SECP521R1:
        return "secp521r1";
    case GroupParams::X25519:
        return "x25519";
    default:
        return "unknown";
    }
}

KeyPtr GroupParams::generateKeyByParams(const GroupParams groupParams)
{
    const auto& param = FindGroupParams(groupParams);

    auto ctx = CryptoManager::getInstance().createKeyContext(param.algorithm);
    ThrowIfFalse(0 < EVP_PKEY_keygen_init(ctx));

    if (groupParams.isEcdhNamedCurve())
    {
        ThrowIfFalse(0 < EVP_PKEY_CTX_set_group_name(ctx, param.groupName));
    }

    Key* pkey{nullptr};
    ThrowIfFalse(0 < EVP_PKEY_keygen(ctx, &pkey));
    return KeyPtr{pkey};
}

KeyPtr GroupParams::decodePublicKey(const GroupParams groupParams, nonstd::span<const uint8_t> encoded)
{
    const auto& param = FindGroupParams(groupParams);
    casket::ThrowIfTrue(encoded.empty(), "Empty public key");

    auto ctx = CryptoManager::getInstance().createKeyContext(param.algorithm);
    ThrowIfFalse(0 < EVP_PKEY_fromdata_init(ctx));

    auto pub = const_cast<uint8_t*>(encoded.data());

    OSSL_PARAM params[3];
    size_t n{0};
    if (param.groupName)
    {
        params[n++] =
            OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, const_cast<char*>(param.groupName), 0);
    }
    params[n++] = OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PUB_KEY, pub, encoded.size());
    params[n] = OSSL_PARAM_construct_end();

    Key* pkey{nullptr};
    ThrowIfFalse(0 < EVP_PKEY_fromdata(ctx, &pkey, EVP_PKEY_PUBLIC_KEY, params), "Invalid public key");
    return KeyPtr{pkey};
}

std::vector<uint8_t> GroupParams::deriveSecret(Key* privateKey, Key* publicKey)
{
    size_t secretLength{0};

    auto ctx = CryptoManager::getInstance().createKeyContext(privateKey);
    ThrowIfFalse(0 < EVP_PKEY_derive_init(ctx));
    ThrowIfFalse(0 < EVP_PKEY_derive_set_peer(ctx, publicKey));
    ThrowIfFalse(0 < EVP_PKEY_derive(ctx, nullptr, &secretLength));

    std::vector<uint8_t> secret(secretLength);
    ThrowIfFalse(0 < EVP_PKEY_derive(ctx, secret.data(), &secretLength));

    secret.resize(secretLength);
    return secret;
}

} // namespace tlsh::crypto
