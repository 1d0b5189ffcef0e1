#include <climits>
#include <openssl/rand.h>
#include <tlsh/crypto/rand.hpp>
#include <tlsh/crypto/exception.hpp>

namespace tlsh::crypto
{

void Rand::generate(uint8_t* random, const size_t randomSize)
{
    ThrowIfTrue(randomSize > INT_MAX, "random buffer too large");
    ThrowIfFalse(0 < RAND_bytes(random, static_cast<int>(randomSize)));
}

} // namespace tlsh::crypto
