#ifndef INCLUDE_SIGID_CORE_IDENTIFIERLAYOUT_HPP
#define INCLUDE_SIGID_CORE_IDENTIFIERLAYOUT_HPP

#include <cstddef>
#include <cstdint>

namespace sigid::core
{

constexpr std::size_t g_identifierBytes{ 16U };
constexpr std::size_t g_timestampBytes{ 6U };
constexpr std::size_t g_typeIdBytes{ 1U };
constexpr std::size_t g_secretIdBytes{ 1U };

// Random and signature fields share this budget; widening one narrows the other.
constexpr std::size_t g_randomAndSignatureBytes{ 8U };

constexpr std::size_t g_minSignatureBytes{ 1U };
constexpr std::size_t g_maxSignatureBytes{ 4U };
constexpr std::size_t g_defaultSignatureBytes{ 2U };
constexpr std::size_t g_maxRandomBytes{ g_randomAndSignatureBytes - g_minSignatureBytes };

constexpr std::uint8_t g_untypedTypeId{ 255U };
constexpr std::uint64_t g_timestampMask{ (std::uint64_t{ 1U } << (g_timestampBytes * 8U)) - 1U };

struct FieldSpan final
{
    std::size_t offset{};
    std::size_t width{};

    [[nodiscard]] constexpr std::size_t end() const noexcept
    {
        return offset + width;
    }
};

// Big-endian field order: timestamp | random | typeId | secretId | signature.
struct IdentifierLayout final
{
    FieldSpan timestamp{};
    FieldSpan random{};
    FieldSpan typeId{};
    FieldSpan secretId{};
    FieldSpan signature{};

    // Bytes covered by the signature.
    [[nodiscard]] constexpr std::size_t prefixBytes() const noexcept
    {
        return signature.offset;
    }

    [[nodiscard]] constexpr std::size_t totalBytes() const noexcept
    {
        return signature.end();
    }
};

[[nodiscard]] constexpr bool isValidSignatureBytes(std::size_t signatureBytes) noexcept
{
    return signatureBytes >= g_minSignatureBytes && signatureBytes <= g_maxSignatureBytes;
}

// Callers validate `signatureBytes` with isValidSignatureBytes() first.
[[nodiscard]] constexpr IdentifierLayout makeIdentifierLayout(std::size_t signatureBytes) noexcept
{
    IdentifierLayout layout{};
    layout.timestamp = FieldSpan{ .offset = 0U, .width = g_timestampBytes };
    layout.random = FieldSpan{ .offset = layout.timestamp.end(), .width = g_randomAndSignatureBytes - signatureBytes };
    layout.typeId = FieldSpan{ .offset = layout.random.end(), .width = g_typeIdBytes };
    layout.secretId = FieldSpan{ .offset = layout.typeId.end(), .width = g_secretIdBytes };
    layout.signature = FieldSpan{ .offset = layout.secretId.end(), .width = signatureBytes };
    return layout;
}

// Fields follow each other without gaps and fill exactly one identifier.
[[nodiscard]] constexpr bool isContiguous(const IdentifierLayout& layout) noexcept
{
    return layout.timestamp.offset == 0U && layout.random.offset == layout.timestamp.end() &&
           layout.typeId.offset == layout.random.end() && layout.secretId.offset == layout.typeId.end() &&
           layout.signature.offset == layout.secretId.end() && layout.totalBytes() == g_identifierBytes;
}

static_assert(isContiguous(makeIdentifierLayout(1U)));
static_assert(isContiguous(makeIdentifierLayout(2U)));
static_assert(isContiguous(makeIdentifierLayout(3U)));
static_assert(isContiguous(makeIdentifierLayout(4U)));

} // namespace sigid::core

#endif // INCLUDE_SIGID_CORE_IDENTIFIERLAYOUT_HPP
