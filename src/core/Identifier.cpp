#include "sigid/core/Identifier.hpp"

#include "BigEndian.hpp"
#include <cstddef>
#include <span>

namespace sigid::core
{
namespace
{

constexpr std::size_t g_kHexDigits{ 32U };
constexpr std::size_t g_kCanonicalLength{ 36U };
constexpr std::array<std::size_t, 4> g_kHyphenPositions{ 8U, 13U, 18U, 23U };

constexpr std::uint8_t g_kNibbleShift{ 4U };
constexpr std::uint8_t g_kNibbleMask{ 0x0FU };
constexpr std::uint8_t g_kDecimalDigits{ 10U };

[[nodiscard]] std::optional<std::uint8_t> hexValue(char c) noexcept
{
    if (c >= '0' && c <= '9')
    {
        return static_cast<std::uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f')
    {
        return static_cast<std::uint8_t>(c - 'a' + g_kDecimalDigits);
    }
    if (c >= 'A' && c <= 'F')
    {
        return static_cast<std::uint8_t>(c - 'A' + g_kDecimalDigits);
    }
    return std::nullopt;
}

[[nodiscard]] bool isHyphenPosition(std::size_t i) noexcept
{
    for (const std::size_t pos : g_kHyphenPositions)
    {
        if (pos == i)
        {
            return true;
        }
    }
    return false;
}

static_assert(g_identifierBytes == 2U * detail::g_kU64Bytes);

} // namespace

[[nodiscard]] Identifier toIdentifierValue(const IdentifierBytes& bytes) noexcept
{
    const std::span<const std::uint8_t> all{ bytes };
    return Identifier{
        .mostSignificantBits = detail::readU64BE(all.first<detail::g_kU64Bytes>()),
        .leastSignificantBits = detail::readU64BE(all.last<detail::g_kU64Bytes>()),
    };
}

[[nodiscard]] IdentifierBytes fromIdentifierValue(const Identifier& id) noexcept
{
    IdentifierBytes out{};
    const std::span<std::uint8_t> all{ out };
    detail::writeU64BE(all.first<detail::g_kU64Bytes>(), id.mostSignificantBits);
    detail::writeU64BE(all.last<detail::g_kU64Bytes>(), id.leastSignificantBits);
    return out;
}

[[nodiscard]] std::string formatIdentifier(const Identifier& id)
{
    constexpr char kHex[] = "0123456789abcdef";

    const IdentifierBytes bytes{ fromIdentifierValue(id) };

    std::string out{};
    out.reserve(g_kCanonicalLength);
    for (const std::uint8_t b : bytes)
    {
        if (isHyphenPosition(out.size()))
        {
            out.push_back('-');
        }
        out.push_back(kHex[(b >> g_kNibbleShift) & g_kNibbleMask]);
        out.push_back(kHex[b & g_kNibbleMask]);
    }
    return out;
}

[[nodiscard]] std::optional<Identifier> parseIdentifier(std::string_view text) noexcept
{
    const bool canonical{ text.size() == g_kCanonicalLength };
    if (!canonical && text.size() != g_kHexDigits)
    {
        return std::nullopt;
    }

    IdentifierBytes bytes{};
    std::size_t nibble{};
    for (std::size_t i{}; i < text.size(); ++i)
    {
        if (canonical && isHyphenPosition(i))
        {
            if (text[i] != '-')
            {
                return std::nullopt;
            }
            continue;
        }

        const auto value{ hexValue(text[i]) };
        if (!value)
        {
            return std::nullopt;
        }

        auto& target{ bytes[nibble / 2U] };
        target = static_cast<std::uint8_t>((nibble % 2U == 0U) ? (*value << g_kNibbleShift) : (target | *value));
        ++nibble;
    }

    return toIdentifierValue(bytes);
}

} // namespace sigid::core
