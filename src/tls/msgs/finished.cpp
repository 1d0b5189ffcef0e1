#include <tlsh/tls/msgs/finished.hpp>
#include <tlsh/utils/data_reader.hpp>
#include <tlsh/utils/data_writer.hpp>

namespace tlsh::tls
{

Finished Finished::deserialize(nonstd::span<const uint8_t> input)
{
    utils::DataReader reader("Finished", input);
    Finished finished;

    auto verifyData = reader.get_span_fixed(TLS_FINISHED_SIZE);
    std::copy(verifyData.begin(), verifyData.end(), finished.verifyData.begin());

    reader.assert_done();
    return finished;
}

size_t Finished::serialize(nonstd::span<uint8_t> output) const
{
    utils::DataWriter writer(output);
    writer.put_span(verifyData);
    return writer.written();
}

} // namespace tlsh::tls
