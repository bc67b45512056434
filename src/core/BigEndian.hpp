#ifndef SIGID_SRC_CORE_BIGENDIAN_HPP
#define SIGID_SRC_CORE_BIGENDIAN_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace sigid::core::detail
{

constexpr std::size_t g_kU48Bytes{ 6U };
constexpr std::size_t g_kU64Bytes{ sizeof(std::uint64_t) };

constexpr std::uint64_t g_kByteMaskU64{ 0xFFU };
constexpr std::uint64_t g_kBitsPerByte{ 8U };

// Writes the low out.size() bytes of v, most significant first.
template <std::size_t N> inline void writeBE(std::span<std::uint8_t, N> out, std::uint64_t v) noexcept
{
    static_assert(N <= g_kU64Bytes);
    for (std::size_t i{}; i < N; ++i)
    {
        const std::uint64_t shiftBits{ static_cast<std::uint64_t>(N - 1U - i) * g_kBitsPerByte };
        out[i] = static_cast<std::uint8_t>((v >> shiftBits) & g_kByteMaskU64);
    }
}

template <std::size_t N> [[nodiscard]] inline std::uint64_t readBE(std::span<const std::uint8_t, N> in) noexcept
{
    static_assert(N <= g_kU64Bytes);
    std::uint64_t v{ 0U };
    for (const std::uint8_t b : in)
    {
        v = (v << g_kBitsPerByte) | static_cast<std::uint64_t>(b);
    }
    return v;
}

inline void writeU48BE(std::span<std::uint8_t, g_kU48Bytes> out, std::uint64_t v) noexcept
{
    writeBE<g_kU48Bytes>(out, v);
}

inline void writeU64BE(std::span<std::uint8_t, g_kU64Bytes> out, std::uint64_t v) noexcept
{
    writeBE<g_kU64Bytes>(out, v);
}

[[nodiscard]] inline std::uint64_t readU48BE(std::span<const std::uint8_t, g_kU48Bytes> in) noexcept
{
    return readBE<g_kU48Bytes>(in);
}

[[nodiscard]] inline std::uint64_t readU64BE(std::span<const std::uint8_t, g_kU64Bytes> in) noexcept
{
    return readBE<g_kU64Bytes>(in);
}

} // namespace sigid::core::detail

#endif // SIGID_SRC_CORE_BIGENDIAN_HPP
