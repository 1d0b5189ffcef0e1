#pragma once
#include <cstddef>
#include <algorithm>
#include <casket/nonstd/span.hpp>
#include <casket/utils/exception.hpp>
#include <openssl/crypto.h>

namespace tlsh::crypto
{

/// @brief Fixed-capacity buffer for secret material, wiped with OPENSSL_cleanse on release.
template <typename T, size_t N>
class SecureArray final
{
public:
    using value_type = T;
    using size_type = size_t;
    using iterator = T*;
    using const_iterator = const T*;

    SecureArray() noexcept
        : size_(0)
    {
    }

    explicit SecureArray(size_type size)
        : size_(0)
    {
        resize(size);
    }

    ~SecureArray() noexcept
    {
        wipe();
    }

    SecureArray(const SecureArray&) = delete;
    SecureArray& operator=(const SecureArray&) = delete;

    SecureArray(SecureArray&& other) noexcept
        : size_(other.size_)
    {
        std::copy_n(other.data_, size_, data_);
        other.wipe();
    }

    SecureArray& operator=(SecureArray&& other) noexcept
    {
        if (this != &other)
        {
            wipe();
            size_ = other.size_;
            std::copy_n(other.data_, size_, data_);
            other.wipe();
        }
        return *this;
    }

    operator nonstd::span<T>() noexcept
    {
        return {data_, size_};
    }

    operator nonstd::span<const T>() const noexcept
    {
        return {data_, size_};
    }

    void assign(nonstd::span<const T> value)
    {
        casket::ThrowIfTrue(value.size() > N, "Requested size exceeds maximum capacity");
        if (value.size() < size_)
        {
            OPENSSL_cleanse(data_ + value.size(), (size_ - value.size()) * sizeof(T));
        }
        std::copy(value.begin(), value.end(), data_);
        size_ = value.size();
    }

    void resize(size_type newSize)
    {
        casket::ThrowIfTrue(newSize > N, "Requested size exceeds maximum capacity");

        if (newSize < size_)
        {
            OPENSSL_cleanse(data_ + newSize, (size_ - newSize) * sizeof(T));
        }
        else if (newSize > size_)
        {
            std::fill_n(data_ + size_, newSize - size_, T{});
        }

        size_ = newSize;
    }

    T& operator[](size_type pos) noexcept
    {
        return data_[pos];
    }

    const T& operator[](size_type pos) const noexcept
    {
        return data_[pos];
    }

    T* data() noexcept
    {
        return data_;
    }

    const T* data() const noexcept
    {
        return data_;
    }

    iterator begin() noexcept
    {
        return data_;
    }

    const_iterator begin() const noexcept
    {
        return data_;
    }

    iterator end() noexcept
    {
        return data_ + size_;
    }

    const_iterator end() const noexcept
    {
        return data_ + size_;
    }

    size_type size() const noexcept
    {
        return size_;
    }

    constexpr size_type capacity() const noexcept
    {
        return N;
    }

    bool empty() const noexcept
    {
        return size_ == 0;
    }

    void clear() noexcept
    {
        wipe();
    }

private:
    void wipe() noexcept
    {
        OPENSSL_cleanse(data_, sizeof(data_));
        size_ = 0;
    }

    T data_[N];
    size_type size_;
};

} // namespace tlsh::crypto
