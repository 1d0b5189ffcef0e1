/// @file
/// @brief Owning pointers for OpenSSL handles.

#pragma once
#include <memory>

namespace tlsh::utils
{

/// @brief Deleter calling a free function of the owning C library.
template <auto FreeFn> struct FreeFunction
{
    template <typename T> void operator()(T* ptr) const noexcept
    {
        FreeFn(ptr);
    }
};

/// @brief unique_ptr that converts implicitly to the raw handle, so it can be
/// passed straight into C APIs.
template <typename T, typename Deleter> class HandlePtr : public std::unique_ptr<T, Deleter>
{
public:
    using std::unique_ptr<T, Deleter>::unique_ptr;

    operator T*() const noexcept
    {
        return this->get();
    }
};

} // namespace tlsh::utils

#define TLSH_DEFINE_CUSTOM_UNIQUE_PTR_WITH_DELETER(alias, object, deleter)                         \
    class alias : public ::tlsh::utils::HandlePtr<object, deleter>                                 \
    {                                                                                              \
    public:                                                                                        \
        using HandlePtr::HandlePtr;                                                                \
    }

#define TLSH_DEFINE_CUSTOM_UNIQUE_PTR(alias, object, freeFn)                                       \
    TLSH_DEFINE_CUSTOM_UNIQUE_PTR_WITH_DELETER(alias, object, ::tlsh::utils::FreeFunction<&freeFn>)
