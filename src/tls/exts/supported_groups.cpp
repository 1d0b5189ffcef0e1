#include <tlsh/tls/exts/supported_groups.hpp>
#include <tlsh/utils/data_reader.hpp>
#include <tlsh/utils/data_writer.hpp>

namespace tlsh::tls
{

SupportedGroups::SupportedGroups(std::vector<crypto::GroupParams> groups)
    : groups_(std::move(groups))
{
}

SupportedGroups::SupportedGroups(Side side, nonstd::span<const uint8_t> input)
{
    (void)side;

    utils::DataReader reader("supported_groups extension", input);
    auto codes = reader.get_uint16_list(2, 1, 32767);
    reader.assert_done();

    groups_.reserve(codes.size());
    for (const auto code : codes)
    {
        groups_.emplace_back(crypto::GroupParams(code));
    }
}

size_t SupportedGroups::serialize(Side side, nonstd::span<uint8_t> output) const
{
    (void)side;

    utils::DataWriter writer(output);
    auto listLength = writer.begin_length(2);
    for (const auto& group : groups_)
    {
        writer.put_uint16_t(group.wireCode());
    }
    writer.finish_length(listLength, 2);
    return writer.written();
}

const std::vector<crypto::GroupParams>& SupportedGroups::getGroups() const
{
    return groups_;
}

} // namespace tlsh::tls
