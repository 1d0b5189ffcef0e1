#include <algorithm>
#include <cstring>

#include <casket/log/log_manager.hpp>
#include <casket/utils/exception.hpp>

#include <openssl/crypto.h>

#include <tlsh/tls/record_layer.hpp>
#include <tlsh/tls/record/cbc_cipher.hpp>
#include <tlsh/tls/record/aead_cipher.hpp>
#include <tlsh/tls/exception.hpp>

namespace tlsh::tls
{

namespace
{

struct ProtectionOps
{
    CipherMode mode;
    size_t (*seal)(CipherState&, RecordType, uint64_t, nonstd::span<const uint8_t>, nonstd::span<uint8_t>);
    size_t (*open)(CipherState&, RecordType, uint64_t, nonstd::span<const uint8_t>, nonstd::span<uint8_t>);
    size_t (*overhead)(const CipherState&);
};

// clang-format off
const ProtectionOps gProtectionOps[] = {
    {CipherMode::CBC,  &CbcCipher::seal,  &CbcCipher::open,  &CbcCipher::overhead},
    {CipherMode::AEAD, &AeadCipher::seal, &AeadCipher::open, &AeadCipher::overhead},
};
// clang-format on

const ProtectionOps& GetProtectionOps(const CipherState& state)
{
    for (const auto& ops : gProtectionOps)
    {
        if (ops.mode == state.suite->mode)
        {
            return ops;
        }
    }
    throw casket::RuntimeError("Unsupported cipher mode");
}

} // namespace

RecordLayer::RecordLayer(ITransport& transport)
    : transport_(transport)
    , version_(ProtocolVersion::TLSv1_2)
    , readTimeout_(std::chrono::seconds(30))
    , maxReadSize_(TLS_HEADER_SIZE + MAX_CIPHERTEXT_SIZE_TLS12)
    , inputOffset_(0)
    , readChunk_(maxReadSize_)
    , output_(TLS_HEADER_SIZE + MAX_CIPHERTEXT_SIZE_TLS12)
{
}

RecordLayer::~RecordLayer() noexcept
{
    reset();
}

void RecordLayer::setMaxReadSize(size_t maxReadSize)
{
    casket::ThrowIfTrue(maxReadSize == 0, "Read size must be positive");
    maxReadSize_ = maxReadSize;
    readChunk_.resize(maxReadSize_);
}

void RecordLayer::reset() noexcept
{
    writeState_.reset();
    readState_.reset();
    if (!input_.empty())
    {
        OPENSSL_cleanse(input_.data(), input_.size());
    }
    input_.clear();
    inputOffset_ = 0;
}

void RecordLayer::enableWriteEncryption(CipherState state)
{
    writeState_ = std::move(state);
    seq_.resetWriteSequence();
}

void RecordLayer::enableReadEncryption(CipherState state)
{
    readState_ = std::move(state);
    seq_.resetReadSequence();
}

void RecordLayer::send(RecordType type, nonstd::span<const uint8_t> data)
{
    size_t offset{0};
    do
    {
        const size_t length = std::min<size_t>(data.size() - offset, MAX_PLAINTEXT_SIZE);
        sendRecord(type, data.subspan(offset, length));
        offset += length;
    } while (offset < data.size());
}

void RecordLayer::sendRecord(RecordType type, nonstd::span<const uint8_t> fragment)
{
    RecordHeader header;
    header.type = type;
    header.version = version_;

    auto body = nonstd::span<uint8_t>(output_).subspan(TLS_HEADER_SIZE);
    size_t length{0};

    if (writeState_)
    {
        const auto& ops = GetProtectionOps(*writeState_);
        length = ops.seal(*writeState_, type, seq_.getWriteSequence(), fragment, body);
    }
    else
    {
        std::memcpy(body.data(), fragment.data(), fragment.size());
        length = fragment.size();
    }

    header.length = static_cast<uint16_t>(length);
    header.serialize(output_);

    std::error_code ec;
    transport_.write({output_.data(), TLS_HEADER_SIZE + length}, ec);
    ThrowIfTrue(bool(ec), Error::IoError, "Failed to write record: " + ec.message());

    seq_.acceptWriteSequence();

    casket::debug("Record >>> {} [{}]", toString(type), fragment.size());
}

void RecordLayer::fillInput(size_t required, std::chrono::steady_clock::time_point deadline)
{
    if (inputOffset_ > 0)
    {
        OPENSSL_cleanse(input_.data(), inputOffset_);
        input_.erase(input_.begin(), input_.begin() + static_cast<std::ptrdiff_t>(inputOffset_));
        inputOffset_ = 0;
    }

    while (input_.size() < required)
    {
        const auto now = std::chrono::steady_clock::now();
        ThrowIfTrue(now >= deadline, Error::Timeout, "Record was not received in time");

        std::error_code ec;
        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        size_t received = transport_.read(readChunk_, remaining, ec);

        if (ec == std::errc::timed_out)
        {
            throw Exception(MakeErrorCode(Error::Timeout), "No data received from peer in time");
        }
        ThrowIfTrue(bool(ec), Error::IoError, "Failed to read record: " + ec.message());

        if (received == 0)
        {
            ThrowIfTrue(input_.empty(), Error::ConnectionClosed, "Connection closed by peer");
            throw Exception(MakeErrorCode(Error::TruncatedRecord), "Connection closed in the middle of a record");
        }

        input_.insert(input_.end(), readChunk_.begin(), readChunk_.begin() + received);
    }
}

Record RecordLayer::receive()
{
    const auto deadline = std::chrono::steady_clock::now() + readTimeout_;

    fillInput(TLS_HEADER_SIZE, deadline);
    auto header = RecordHeader::deserialize({input_.data() + inputOffset_, TLS_HEADER_SIZE});

    ThrowIfTrue(!readState_ && header.length > MAX_PLAINTEXT_SIZE, Error::RecordTooLarge,
                "Received a plaintext record that exceeds maximum size");

    fillInput(TLS_HEADER_SIZE + header.length, deadline);

    auto fragment = nonstd::span<const uint8_t>(input_).subspan(inputOffset_ + TLS_HEADER_SIZE, header.length);
    std::vector<uint8_t> payload;

    if (readState_)
    {
        payload.resize(fragment.size());
        const auto& ops = GetProtectionOps(*readState_);
        size_t length = ops.open(*readState_, header.type, seq_.getReadSequence(), fragment, payload);
        payload.resize(length);

        ThrowIfTrue(payload.size() > MAX_PLAINTEXT_SIZE, Error::RecordTooLarge,
                    "Decrypted record exceeds maximum size");
    }
    else
    {
        payload.assign(fragment.begin(), fragment.end());
    }

    inputOffset_ += TLS_HEADER_SIZE + header.length;
    seq_.acceptReadSequence();

    ThrowIfTrue(payload.empty() && header.type != RecordType::ApplicationData, Error::MalformedMessage,
                "Received an empty " + toString(header.type) + " record");

    casket::debug("Record <<< {} [{}]", toString(header.type), payload.size());

    return Record(header.type, header.version, std::move(payload));
}

} // namespace tlsh::tls
