#pragma once
#include <cstdint>
#include <limits>
#include <tlsh/tls/exception.hpp>

namespace tlsh::tls
{

/// @brief TLS record layer sequence number tracker
class SequenceNumbers final
{
public:
    /// @brief Construct with both sequences initialized to 0
    SequenceNumbers() noexcept
        : readSeqNumber_(0)
        , writeSeqNumber_(0)
    {
    }

    void resetReadSequence() noexcept
    {
        readSeqNumber_ = 0;
    }

    void resetWriteSequence() noexcept
    {
        writeSeqNumber_ = 0;
    }

    uint64_t getReadSequence() const noexcept
    {
        return readSeqNumber_;
    }

    uint64_t getWriteSequence() const noexcept
    {
        return writeSeqNumber_;
    }

    /// @brief Increment read sequence number
    void acceptReadSequence()
    {
        ThrowIfTrue(readSeqNumber_ == std::numeric_limits<uint64_t>::max(), Error::IllegalParameter,
                    "Read sequence number exhausted");
        ++readSeqNumber_;
    }

    /// @brief Increment write sequence number
    void acceptWriteSequence()
    {
        ThrowIfTrue(writeSeqNumber_ == std::numeric_limits<uint64_t>::max(), Error::IllegalParameter,
                    "Write sequence number exhausted");
        ++writeSeqNumber_;
    }

private:
    uint64_t readSeqNumber_;
    uint64_t writeSeqNumber_;
};

} // namespace tlsh::tls
