#ifndef INCLUDE_SIGID_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_SIGID_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <type_traits>

namespace sigid::security
{

// Zeroes the bytes in a way the optimiser is not allowed to drop.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

// Raw storage of a single object, e.g. a third-party hashing context on the stack.
template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
[[nodiscard]] std::span<std::byte> objectBytes(T& object) noexcept
{
    return std::as_writable_bytes(std::span<T, 1>{ &object, 1 });
}

} // namespace sigid::security

#endif // INCLUDE_SIGID_SECURITY_MEMORYWIPER_HPP
