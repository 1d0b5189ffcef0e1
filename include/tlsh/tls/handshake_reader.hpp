#pragma once
#include <optional>
#include <vector>
#include <casket/nonstd/span.hpp>
#include <tlsh/tls/types.hpp>

namespace tlsh::tls
{

/// @brief Reassembles handshake messages fragmented across records or coalesced in one record.
class HandshakeReader final
{
public:
    explicit HandshakeReader(size_t maxMessageSize = MAX_HANDSHAKE_MESSAGE_SIZE);

    /// @brief Appends the payload of a handshake record.
    void append(nonstd::span<const uint8_t> fragment);

    /// @brief Extracts the next complete message with its header.
    ///
    /// @return Message bytes or nothing if more data is required.
    ///
    /// @throws tls::Exception (RecordTooLarge) if the announced message length exceeds the limit.
    std::optional<std::vector<uint8_t>> next();

    /// @brief Checks whether a partial message is buffered.
    bool empty() const noexcept
    {
        return buffer_.empty();
    }

    void reset() noexcept;

private:
    size_t maxMessageSize_;
    std::vector<uint8_t> buffer_;
};

} // namespace tlsh::tls
