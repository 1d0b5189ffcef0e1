/// @file
/// @brief Declaration of the TLS extensions block.

#pragma once

#include <algorithm>
#include <memory>
#include <set>
#include <vector>
#include <tlsh/tls/types.hpp>

#include <tlsh/tls/exts/extended_master_secret.hpp>
#include <tlsh/tls/exts/reneg_extension.hpp>
#include <tlsh/tls/exts/server_name_indication.hpp>
#include <tlsh/tls/exts/signature_algorithms.hpp>
#include <tlsh/tls/exts/supported_groups.hpp>
#include <tlsh/tls/exts/supported_point_formats.hpp>
#include <tlsh/tls/exts/unknown_extension.hpp>

namespace tlsh::tls
{

/// @brief Represents a block of extensions in a hello message.
class Extensions final
{
public:
    /// @brief Gets the types of extensions.
    std::set<ExtensionCode> extensionTypes() const;

    /// @brief Gets all extensions in wire order.
    const std::vector<std::unique_ptr<Extension>>& all() const
    {
        return extensions_;
    }

    /// @brief Gets an extension of a specific type.
    ///
    /// @tparam T The type of the extension.
    ///
    /// @return A pointer to the extension if found, otherwise nullptr.
    template <typename T>
    T* get() const
    {
        return dynamic_cast<T*>(get(T::staticType()));
    }

    template <typename T>
    bool has() const
    {
        return get<T>() != nullptr;
    }

    bool has(ExtensionCode type) const
    {
        return get(type) != nullptr;
    }

    size_t size() const
    {
        return extensions_.size();
    }

    bool empty() const
    {
        return extensions_.empty();
    }

    /// @brief Adds an extension.
    ///
    /// @throws tls::Exception (MalformedMessage) if an extension of the same type is present.
    void add(std::unique_ptr<Extension> extn);

    Extension* get(ExtensionCode type) const
    {
        const auto i = std::find_if(extensions_.cbegin(), extensions_.cend(),
                                    [type](const auto& ext) { return ext->type() == type; });

        return (i != extensions_.end()) ? i->get() : nullptr;
    }

    /// @brief Deserializes the extension block including its 2-byte length.
    ///
    /// @param[in] side Side that produced the block.
    /// @param[in] input Block bytes.
    void deserialize(Side side, nonstd::span<const uint8_t> input);

    /// @brief Checks if the block contains any types other than the allowed ones.
    bool containsOtherThan(const std::set<ExtensionCode>& allowedExtensions) const;

    Extensions() = default;

    Extensions(const Extensions&) = delete;
    Extensions& operator=(const Extensions&) = delete;

    Extensions(Extensions&&) = default;
    Extensions& operator=(Extensions&&) = default;

    Extensions(Side side, nonstd::span<const uint8_t> input)
    {
        deserialize(side, input);
    }

    /// @brief Serializes the extension block including its 2-byte length.
    ///
    /// @return Serialized bytes count.
    size_t serialize(Side whoami, nonstd::span<uint8_t> buffer) const;

private:
    std::vector<std::unique_ptr<Extension>> extensions_;
};

} // namespace tlsh::tls
