#pragma once
#include <cstdint>
#include <cstddef>
#include <casket/nonstd/span.hpp>

namespace tlsh::crypto
{

class Rand final
{
public:
    static void generate(uint8_t* random, const size_t randomSize);

    static inline void generate(nonstd::span<uint8_t> buffer)
    {
        generate(buffer.data(), buffer.size());
    }
};

} // namespace tlsh::crypto
