#ifndef INCLUDE_SIGID_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_SIGID_SECURITY_SECUREBUFFER_HPP

#include "sigid/security/MemoryWiper.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

namespace sigid::security
{

// Every block is wiped before it goes back to the heap, including the old block on growth.
template <class T> struct WipingAllocator
{
    using value_type = T;
    using is_always_equal = std::true_type;

    WipingAllocator() noexcept = default;

    template <class U> constexpr WipingAllocator([[maybe_unused]] const WipingAllocator<U>& other) noexcept
    {
    }

    [[nodiscard]] T* allocate(std::size_t count)
    {
        return std::allocator<T>{}.allocate(count);
    }

    void deallocate(T* ptr, std::size_t count) noexcept
    {
        if (ptr == nullptr)
        {
            return;
        }
        secureWipe(std::as_writable_bytes(std::span<T>{ ptr, count }));
        std::allocator<T>{}.deallocate(ptr, count);
    }
};

template <class T, class U>
constexpr bool operator==([[maybe_unused]] const WipingAllocator<T>& lhs,
                          [[maybe_unused]] const WipingAllocator<U>& rhs) noexcept
{
    return true;
}

// Secret material and full digests.
using SecureBuffer = std::vector<std::uint8_t, WipingAllocator<std::uint8_t>>;

[[nodiscard]] inline SecureBuffer secureBufferFrom(std::string_view s)
{
    SecureBuffer buf{};
    buf.reserve(s.size());
    for (const char c : s)
    {
        buf.push_back(static_cast<std::uint8_t>(static_cast<unsigned char>(c)));
    }
    return buf;
}

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const SecureBuffer& b) noexcept
{
    return std::span{ b };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureBuffer& b) noexcept
{
    return std::as_writable_bytes(std::span{ b });
}

} // namespace sigid::security

#endif // INCLUDE_SIGID_SECURITY_SECUREBUFFER_HPP
