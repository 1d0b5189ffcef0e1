/// @file
/// @brief Declaration of the RecordLayer class.

#pragma once
#include <chrono>
#include <optional>
#include <vector>
#include <casket/nonstd/span.hpp>
#include <casket/utils/noncopyable.hpp>
#include <tlsh/tls/i_transport.hpp>
#include <tlsh/tls/record.hpp>
#include <tlsh/tls/sequence_numbers.hpp>
#include <tlsh/tls/record/cipher_state.hpp>

namespace tlsh::tls
{

/// @brief Frames, protects and unframes TLS records over a transport.
///
/// Encryption of each direction is switched on once and stays on until the
/// layer is reset. Sequence numbers advance by one for every record.
class RecordLayer final : public casket::NonCopyable
{
public:
    explicit RecordLayer(ITransport& transport);

    ~RecordLayer() noexcept;

    inline void setVersion(const ProtocolVersion& version) noexcept
    {
        version_ = version;
    }

    inline ProtocolVersion getVersion() const noexcept
    {
        return version_;
    }

    /// @brief Sets the time limit for receiving one whole record.
    inline void setReadTimeout(std::chrono::milliseconds timeout) noexcept
    {
        readTimeout_ = timeout;
    }

    /// @brief Sets the largest chunk requested from the transport by one read.
    void setMaxReadSize(size_t maxReadSize);

    /// @brief Sends @p data as one or more records of @p type.
    ///
    /// @throws tls::Exception IoError when the transport fails.
    void send(RecordType type, nonstd::span<const uint8_t> data);

    /// @brief Receives the next record, decrypting it when read protection is active.
    ///
    /// @throws tls::Exception with TruncatedRecord, ConnectionClosed, Timeout,
    ///         IoError, RecordTooLarge or BadRecordMac.
    Record receive();

    /// @brief Protects every following outgoing record with @p state.
    void enableWriteEncryption(CipherState state);

    /// @brief Expects every following incoming record to be protected with @p state.
    void enableReadEncryption(CipherState state);

    inline bool isWriteEncrypted() const noexcept
    {
        return writeState_.has_value();
    }

    inline bool isReadEncrypted() const noexcept
    {
        return readState_.has_value();
    }

    /// @brief Number of bytes held in the input buffer, consumed or not.
    inline size_t getBufferedSize() const noexcept
    {
        return input_.size();
    }

    inline const SequenceNumbers& getSequenceNumbers() const noexcept
    {
        return seq_;
    }

    /// @brief Drops both cipher states, wiping their keys.
    void reset() noexcept;

private:
    void sendRecord(RecordType type, nonstd::span<const uint8_t> fragment);

    void fillInput(size_t required, std::chrono::steady_clock::time_point deadline);

private:
    ITransport& transport_;
    ProtocolVersion version_;
    std::chrono::milliseconds readTimeout_;
    size_t maxReadSize_;
    SequenceNumbers seq_;
    std::optional<CipherState> writeState_;
    std::optional<CipherState> readState_;
    std::vector<uint8_t> input_;
    size_t inputOffset_;
    std::vector<uint8_t> readChunk_;
    std::vector<uint8_t> output_;
};

} // namespace tlsh::tls
