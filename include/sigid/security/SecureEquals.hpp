#ifndef INCLUDE_SIGID_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_SIGID_SECURITY_SECUREEQUALS_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace sigid::security
{
// Visits every byte regardless of where the first mismatch is.
[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile std::uint8_t diff{};
    for (std::size_t i{}; i < a.size(); ++i)
    {
        diff = static_cast<std::uint8_t>(diff | (a[i] ^ b[i]));
    }

    return (diff == 0U);
}

} // namespace sigid::security

#endif // INCLUDE_SIGID_SECURITY_SECUREEQUALS_HPP
