#pragma once
#include <string>
#include <vector>
#include <casket/nonstd/span.hpp>
#include <casket/utils/format.hpp>
#include <casket/utils/load_store.hpp>
#include <tlsh/tls/exception.hpp>

namespace tlsh::utils
{

/// @brief Bounds-checked reader over a TLS wire buffer.
///
/// Every failed check raises tls::Error::MalformedMessage naming the structure being decoded.
class DataReader final
{
public:
    DataReader(const char* type, nonstd::span<const uint8_t> buf_in)
        : m_typename(type)
        , m_buf(buf_in)
        , m_offset(0)
    {
    }

    void assert_done() const
    {
        if (has_remaining())
        {
            throw_decode_error("Extra bytes at end of message");
        }
    }

    size_t read_so_far() const
    {
        return m_offset;
    }

    size_t remaining_bytes() const
    {
        return m_buf.size() - m_offset;
    }

    bool has_remaining() const
    {
        return (remaining_bytes() > 0);
    }

    nonstd::span<const uint8_t> get_span_remaining()
    {
        auto result = m_buf.subspan(m_offset);
        m_offset = m_buf.size();
        return result;
    }

    void discard_next(size_t bytes)
    {
        assert_at_least(bytes);
        m_offset += bytes;
    }

    uint32_t get_uint24_t()
    {
        assert_at_least(3);
        uint32_t result = casket::make_uint32(0, m_buf[m_offset], m_buf[m_offset + 1], m_buf[m_offset + 2]);
        m_offset += 3;
        return result;
    }

    uint16_t get_uint16_t()
    {
        assert_at_least(2);
        uint16_t result = casket::make_uint16(m_buf[m_offset], m_buf[m_offset + 1]);
        m_offset += 2;
        return result;
    }

    uint16_t peek_uint16_t() const
    {
        assert_at_least(2);
        return casket::make_uint16(m_buf[m_offset], m_buf[m_offset + 1]);
    }

    uint8_t get_byte()
    {
        assert_at_least(1);
        uint8_t result = m_buf[m_offset];
        m_offset += 1;
        return result;
    }

    nonstd::span<const uint8_t> get_span_fixed(size_t size)
    {
        assert_at_least(size);
        auto result = m_buf.subspan(m_offset, size);
        m_offset += size;
        return result;
    }

    /// @brief Reads a length-prefixed vector of elements of @p elemSize bytes each.
    ///
    /// @param lenBytes Size of the length prefix (1, 2 or 3).
    /// @param elemSize Size of one element.
    /// @param minElems Minimum number of elements.
    /// @param maxElems Maximum number of elements.
    ///
    /// @return Raw bytes of the vector body.
    nonstd::span<const uint8_t> get_span(size_t lenBytes, size_t elemSize, size_t minElems, size_t maxElems)
    {
        const size_t numElems = get_num_elems(lenBytes, elemSize, minElems, maxElems);
        return get_span_fixed(numElems * elemSize);
    }

    nonstd::span<const uint8_t> get_span_length_and_value(size_t lenBytes)
    {
        return get_span_fixed(get_length_field(lenBytes));
    }

    std::vector<uint16_t> get_uint16_list(size_t lenBytes, size_t minElems, size_t maxElems)
    {
        const size_t numElems = get_num_elems(lenBytes, sizeof(uint16_t), minElems, maxElems);
        std::vector<uint16_t> result(numElems);
        for (auto& value : result)
        {
            value = get_uint16_t();
        }
        return result;
    }

private:
    size_t get_length_field(size_t lenBytes)
    {
        assert_at_least(lenBytes);

        if (lenBytes == 1)
        {
            return get_byte();
        }
        else if (lenBytes == 2)
        {
            return get_uint16_t();
        }
        else if (lenBytes == 3)
        {
            return get_uint24_t();
        }

        throw_decode_error("Bad length size");
    }

    size_t get_num_elems(size_t lenBytes, size_t elemSize, size_t minElems, size_t maxElems)
    {
        const size_t byteLength = get_length_field(lenBytes);

        if (byteLength % elemSize != 0)
        {
            throw_decode_error("Size isn't multiple of element size");
        }

        const size_t numElems = byteLength / elemSize;

        if (numElems < minElems || numElems > maxElems)
        {
            throw_decode_error("Length field outside parameters");
        }

        return numElems;
    }

    void assert_at_least(size_t n) const
    {
        if (m_buf.size() - m_offset < n)
        {
            throw_decode_error("Expected " + std::to_string(n) + " bytes remaining, only " +
                               std::to_string(m_buf.size() - m_offset) + " left");
        }
    }

    [[noreturn]] void throw_decode_error(std::string_view why) const
    {
        throw tls::Exception(tls::MakeErrorCode(tls::Error::MalformedMessage),
                             casket::format("Invalid {}: {}", m_typename, why));
    }

    const char* m_typename;
    nonstd::span<const uint8_t> m_buf;
    size_t m_offset;
};

} // namespace tlsh::utils
