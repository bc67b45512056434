#ifndef INCLUDE_SIGID_SECURITY_SECURERANDOM_HPP
#define INCLUDE_SIGID_SECURITY_SECURERANDOM_HPP

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <span>
#include <type_traits>

namespace sigid::security
{

// Fills `out` from the operating system CSPRNG. Returns false if the OS source fails.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

template <typename Fill>
concept RandomFill = std::is_nothrow_invocable_r_v<bool, Fill&, std::span<std::uint8_t>>;

constexpr std::size_t g_kRandomBelowMaxAttempts{ 128U };

// Uniform value in [0, maxExcl) drawn from `fill` by rejection sampling.
template <RandomFill Fill> [[nodiscard]] bool randomBelow(Fill& fill, std::uint64_t maxExcl, std::uint64_t& out) noexcept
{
    if (maxExcl == 0U)
    {
        return false;
    }
    if (maxExcl == 1U)
    {
        out = 0U;
        return true;
    }

    const std::uint64_t limit{ (std::numeric_limits<std::uint64_t>::max() / maxExcl) * maxExcl };

    for (std::size_t attempt{}; attempt < g_kRandomBelowMaxAttempts; ++attempt)
    {
        std::array<std::uint8_t, sizeof(std::uint64_t)> bytes{};
        if (!fill(std::span<std::uint8_t>{ bytes }))
        {
            return false;
        }

        std::uint64_t candidate{};
        std::memcpy(&candidate, bytes.data(), sizeof(candidate));
        if (candidate < limit)
        {
            out = candidate % maxExcl;
            return true;
        }
    }
    return false;
}

} // namespace sigid::security

#endif // INCLUDE_SIGID_SECURITY_SECURERANDOM_HPP
