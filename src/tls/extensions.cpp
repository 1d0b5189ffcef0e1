#include <iterator>
#include <tlsh/tls/extensions.hpp>
#include <tlsh/tls/exception.hpp>
#include <tlsh/utils/data_reader.hpp>

#include <casket/utils/format.hpp>
#include <casket/utils/load_store.hpp>

namespace tlsh::tls
{

namespace
{

std::unique_ptr<Extension> makeExtension(nonstd::span<const uint8_t> input, ExtensionCode code, const Side side)
{
    switch (code)
    {
    case ExtensionCode::ServerNameIndication:
        return std::make_unique<ServerNameIndicator>(side, input);

    case ExtensionCode::SupportedGroups:
        return std::make_unique<SupportedGroups>(side, input);

    case ExtensionCode::ECPointFormats:
        return std::make_unique<SupportedPointFormats>(side, input);

    case ExtensionCode::SignatureAlgorithms:
        return std::make_unique<SignatureAlgorithms>(side, input);

    case ExtensionCode::ExtendedMasterSecret:
        return std::make_unique<ExtendedMasterSecret>(side, input);

    case ExtensionCode::SafeRenegotiation:
        return std::make_unique<RenegotiationExtension>(side, input);

    default:
        break;
    }

    return std::make_unique<UnknownExtension>(code, input);
}

} // namespace

void Extensions::add(std::unique_ptr<Extension> extn)
{
    ThrowIfTrue(has(extn->type()), Error::MalformedMessage,
                casket::format("duplicate extension '{}'", static_cast<uint16_t>(extn->type())));

    extensions_.emplace_back(std::move(extn));
}

void Extensions::deserialize(Side side, nonstd::span<const uint8_t> input)
{
    utils::DataReader reader("Extensions", input);

    const uint16_t allExtSize = reader.get_uint16_t();
    ThrowIfTrue(reader.remaining_bytes() != allExtSize, Error::MalformedMessage, "bad extension size");

    while (reader.has_remaining())
    {
        const uint16_t extensionCode = reader.get_uint16_t();
        auto extensionData = reader.get_span_length_and_value(2);

        add(makeExtension(extensionData, static_cast<ExtensionCode>(extensionCode), side));
    }
    reader.assert_done();
}

bool Extensions::containsOtherThan(const std::set<ExtensionCode>& allowedExtensions) const
{
    const auto found = extensionTypes();

    std::vector<ExtensionCode> diff;
    std::set_difference(found.cbegin(), found.cend(), allowedExtensions.cbegin(), allowedExtensions.cend(),
                        std::back_inserter(diff));

    return !diff.empty();
}

std::set<ExtensionCode> Extensions::extensionTypes() const
{
    std::set<ExtensionCode> offers;
    std::transform(extensions_.cbegin(), extensions_.cend(), std::inserter(offers, offers.begin()),
                   [](const auto& ext) { return ext->type(); });
    return offers;
}

size_t Extensions::serialize(Side whoami, nonstd::span<uint8_t> buffer) const
{
    ThrowIfTrue(buffer.size_bytes() < 2, Error::IllegalParameter, "buffer too small for extension list");

    size_t totalWritten = 0;
    auto data = buffer.subspan(2);

    for (const auto& extension : extensions_)
    {
        ThrowIfTrue(data.size_bytes() < 4, Error::IllegalParameter, "buffer too small for extension header");
        auto extensionBody = data.subspan(4);

        uint16_t extensionType = static_cast<uint16_t>(extension->type());
        uint16_t extensionLength = static_cast<uint16_t>(extension->serialize(whoami, extensionBody));

        data[0] = casket::get_byte<0>(extensionType);
        data[1] = casket::get_byte<1>(extensionType);

        data[2] = casket::get_byte<0>(extensionLength);
        data[3] = casket::get_byte<1>(extensionLength);

        data = data.subspan(extensionLength + 4);
        totalWritten += extensionLength + 4;
    }

    buffer[0] = casket::get_byte<0>(static_cast<uint16_t>(totalWritten));
    buffer[1] = casket::get_byte<1>(static_cast<uint16_t>(totalWritten));
    totalWritten += 2;

    return totalWritten;
}

} // namespace tlsh::tls
