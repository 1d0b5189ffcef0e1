#include <array>
#include <casket/utils/load_store.hpp>
#include <tlsh/crypto/hmac_traits.hpp>
#include <tlsh/tls/record/tls1_mac.hpp>

using namespace tlsh::crypto;

namespace tlsh::tls
{

nonstd::span<uint8_t> computeTls1Mac(MacCtx* ctx, const Hash* hash, nonstd::span<const uint8_t> macKey,
                                     uint64_t seq, RecordType recordType, ProtocolVersion version,
                                     nonstd::span<const uint8_t> content, nonstd::span<uint8_t> buffer)
{
    std::array<uint8_t, 13> meta;
    casket::store_be(seq, meta.data());
    meta[8] = static_cast<uint8_t>(recordType);
    meta[9] = version.majorVersion();
    meta[10] = version.minorVersion();
    uint16_t s = static_cast<uint16_t>(content.size());
    meta[11] = casket::get_byte<0>(s);
    meta[12] = casket::get_byte<1>(s);

    HmacTraits::initHmac(ctx, hash, macKey);
    HmacTraits::updateHmac(ctx, meta);
    HmacTraits::updateHmac(ctx, content);
    return HmacTraits::finalHmac(ctx, buffer);
}

} // namespace tlsh::tls
