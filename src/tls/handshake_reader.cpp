#include <tlsh/tls/handshake_reader.hpp>
#include <tlsh/tls/exception.hpp>

#include <casket/utils/format.hpp>
#include <casket/utils/load_store.hpp>

namespace tlsh::tls
{

HandshakeReader::HandshakeReader(size_t maxMessageSize)
    : maxMessageSize_(maxMessageSize)
{
}

void HandshakeReader::append(nonstd::span<const uint8_t> fragment)
{
    buffer_.insert(buffer_.end(), fragment.begin(), fragment.end());
}

std::optional<std::vector<uint8_t>> HandshakeReader::next()
{
    if (buffer_.size() < TLS_HANDSHAKE_HEADER_SIZE)
    {
        return std::nullopt;
    }

    const size_t length = casket::make_uint32(0, buffer_[1], buffer_[2], buffer_[3]);
    ThrowIfTrue(length > maxMessageSize_, Error::RecordTooLarge,
                casket::format("handshake message of {} bytes exceeds limit {}", length, maxMessageSize_));

    const size_t total = TLS_HANDSHAKE_HEADER_SIZE + length;
    if (buffer_.size() < total)
    {
        return std::nullopt;
    }

    std::vector<uint8_t> message(buffer_.begin(), buffer_.begin() + total);
    buffer_.erase(buffer_.begin(), buffer_.begin() + total);
    return message;
}

void HandshakeReader::reset() noexcept
{
    buffer_.clear();
}

} // namespace tlsh::tls
