#pragma once
#include <vector>
#include <tlsh/tls/exts/extension.hpp>
#include <tlsh/crypto/signature_scheme.hpp>

namespace tlsh::tls
{

/// @brief Signature Algorithms extension.
class SignatureAlgorithms final : public Extension
{
public:
    static ExtensionCode staticType()
    {
        return ExtensionCode::SignatureAlgorithms;
    }

    ExtensionCode type() const override
    {
        return staticType();
    }

    size_t serialize(Side side, nonstd::span<uint8_t> output) const override;

    explicit SignatureAlgorithms(std::vector<crypto::SignatureScheme> schemes);

    SignatureAlgorithms(Side side, nonstd::span<const uint8_t> input);

    const std::vector<crypto::SignatureScheme>& supportedSchemes() const;

private:
    std::vector<crypto::SignatureScheme> schemes_;
};

} // namespace tlsh::tls
