#ifndef INCLUDE_SIGID_CORE_IDENTIFIER_HPP
#define INCLUDE_SIGID_CORE_IDENTIFIER_HPP

#include "sigid/core/IdentifierLayout.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sigid::core
{

using IdentifierBytes = std::array<std::uint8_t, g_identifierBytes>;

// UUID-compatible value: high-order half first, each half big-endian.
struct Identifier final
{
    std::uint64_t mostSignificantBits{ 0U };
    std::uint64_t leastSignificantBits{ 0U };

    friend bool operator==(const Identifier&, const Identifier&) = default;
};

[[nodiscard]] Identifier toIdentifierValue(const IdentifierBytes& bytes) noexcept;
[[nodiscard]] IdentifierBytes fromIdentifierValue(const Identifier& id) noexcept;

// Lowercase canonical text: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx.
[[nodiscard]] std::string formatIdentifier(const Identifier& id);

// Accepts the canonical hyphenated form or 32 bare hex digits, in either case.
[[nodiscard]] std::optional<Identifier> parseIdentifier(std::string_view text) noexcept;

} // namespace sigid::core

#endif // INCLUDE_SIGID_CORE_IDENTIFIER_HPP
