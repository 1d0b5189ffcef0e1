#pragma once
#include <cstdint>
#include <algorithm>

#include <casket/nonstd/span.hpp>
#include <casket/utils/exception.hpp>
#include <casket/utils/load_store.hpp>

namespace tlsh::utils
{

/// @brief Writes a TLS vector: a big-endian length prefix of @p tagSize bytes followed by the values.
///
/// @return Number of bytes written.
template <typename T>
size_t append_length_and_value(nonstd::span<uint8_t> outputBuffer, const T* vals, size_t valsSize, size_t tagSize)
{
    constexpr size_t typeSize = sizeof(T);
    const size_t valueBytes = typeSize * valsSize;
    const size_t requiredSize = tagSize + valueBytes;

    casket::ThrowIfTrue(outputBuffer.size() < requiredSize, "append_length_and_value: buffer too small");
    casket::ThrowIfTrue(tagSize != 1 && tagSize != 2 && tagSize != 3, "append_length_and_value: invalid tag size");
    casket::ThrowIfTrue((tagSize == 1 && valueBytes > 255) || (tagSize == 2 && valueBytes > 65535) ||
                            (tagSize == 3 && valueBytes > 16777215),
                        "append_length_and_value: value too large");

    for (size_t i = 0; i != tagSize; ++i)
    {
        outputBuffer[i] = casket::get_byte_var(sizeof(valueBytes) - tagSize + i, valueBytes);
    }

    for (size_t i = 0; i != valsSize; ++i)
    {
        for (size_t j = 0; j != typeSize; ++j)
        {
            outputBuffer[tagSize + i * typeSize + j] = casket::get_byte_var(j, vals[i]);
        }
    }

    return requiredSize;
}

/// @brief Sequential writer over a caller-provided output buffer.
class DataWriter final
{
public:
    explicit DataWriter(nonstd::span<uint8_t> output)
        : output_(output)
        , offset_(0)
    {
    }

    void put_byte(uint8_t value)
    {
        ensure(1);
        output_[offset_++] = value;
    }

    void put_uint16_t(uint16_t value)
    {
        ensure(2);
        output_[offset_++] = casket::get_byte<0>(value);
        output_[offset_++] = casket::get_byte<1>(value);
    }

    void put_uint24_t(uint32_t value)
    {
        casket::ThrowIfTrue(value > 0xFFFFFF, "DataWriter: value too large for uint24");
        ensure(3);
        output_[offset_++] = casket::get_byte<1>(value);
        output_[offset_++] = casket::get_byte<2>(value);
        output_[offset_++] = casket::get_byte<3>(value);
    }

    void put_span(nonstd::span<const uint8_t> data)
    {
        ensure(data.size());
        std::copy(data.begin(), data.end(), output_.begin() + offset_);
        offset_ += data.size();
    }

    template <typename T>
    void put_length_and_value(const T* vals, size_t valsSize, size_t tagSize)
    {
        offset_ += append_length_and_value(output_.subspan(offset_), vals, valsSize, tagSize);
    }

    void put_length_and_value(nonstd::span<const uint8_t> data, size_t tagSize)
    {
        put_length_and_value(data.data(), data.size(), tagSize);
    }

    /// @brief Reserves room for a length prefix to be filled by @ref finish_length.
    size_t begin_length(size_t tagSize)
    {
        ensure(tagSize);
        size_t position = offset_;
        offset_ += tagSize;
        return position;
    }

    void finish_length(size_t position, size_t tagSize)
    {
        const size_t length = offset_ - position - tagSize;
        casket::ThrowIfTrue((tagSize == 1 && length > 255) || (tagSize == 2 && length > 65535) ||
                                (tagSize == 3 && length > 16777215),
                            "DataWriter: value too large");
        for (size_t i = 0; i != tagSize; ++i)
        {
            output_[position + i] = casket::get_byte_var(sizeof(length) - tagSize + i, length);
        }
    }

    size_t written() const noexcept
    {
        return offset_;
    }

private:
    void ensure(size_t n) const
    {
        casket::ThrowIfTrue(output_.size() - offset_ < n, "DataWriter: buffer too small");
    }

    nonstd::span<uint8_t> output_;
    size_t offset_;
};

} // namespace tlsh::utils
