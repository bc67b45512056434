#include "sigid/core/Codec.hpp"

#include "BigEndian.hpp"
#include <algorithm>
#include <stdexcept>

namespace sigid::core
{
namespace
{

constexpr std::size_t g_kU48Bytes{ detail::g_kU48Bytes };

static_assert(g_timestampBytes == g_kU48Bytes);

void requireExactSize(std::span<const std::uint8_t> s, std::size_t expected, const char* what)
{
    if (s.size() != expected)
    {
        throw std::invalid_argument(what);
    }
}

} // namespace

Codec::Codec(std::size_t signatureBytes)
{
    if (!isValidSignatureBytes(signatureBytes))
    {
        throw std::invalid_argument("Codec: signatureBytes must be within [1, 4]");
    }
    m_layout = makeIdentifierLayout(signatureBytes);
}

const IdentifierLayout& Codec::layout() const noexcept
{
    return m_layout;
}

[[nodiscard]] IdentifierBytes Codec::packPrefix(std::uint64_t timestampMs, std::span<const std::uint8_t> random,
                                                std::uint8_t typeId, std::uint8_t secretId) const
{
    requireExactSize(random, m_layout.random.width, "packPrefix: random field has wrong length");

    IdentifierBytes out{};
    detail::writeU48BE(std::span<std::uint8_t, g_kU48Bytes>{ out.data() + m_layout.timestamp.offset, g_kU48Bytes },
                       timestampMs & g_timestampMask);
    std::ranges::copy(random, out.begin() + static_cast<std::ptrdiff_t>(m_layout.random.offset));
    out[m_layout.typeId.offset] = typeId;
    out[m_layout.secretId.offset] = secretId;
    return out;
}

void Codec::writeSignature(IdentifierBytes& bytes, std::span<const std::uint8_t> signature) const
{
    requireExactSize(signature, m_layout.signature.width, "writeSignature: signature has wrong length");
    std::ranges::copy(signature, bytes.begin() + static_cast<std::ptrdiff_t>(m_layout.signature.offset));
}

[[nodiscard]] IdentifierBytes Codec::pack(std::uint64_t timestampMs, std::span<const std::uint8_t> random,
                                          std::uint8_t typeId, std::uint8_t secretId,
                                          std::span<const std::uint8_t> signature) const
{
    IdentifierBytes out{ packPrefix(timestampMs, random, typeId, secretId) };
    writeSignature(out, signature);
    return out;
}

[[nodiscard]] UnpackedIdentifier Codec::unpack(const IdentifierBytes& bytes) const
{
    UnpackedIdentifier fields{};
    fields.timestampMs = detail::readU48BE(
        std::span<const std::uint8_t, g_kU48Bytes>{ bytes.data() + m_layout.timestamp.offset, g_kU48Bytes });
    fields.typeId = bytes[m_layout.typeId.offset];
    fields.secretId = bytes[m_layout.secretId.offset];

    const auto sig{ std::span<const std::uint8_t>{ bytes }.subspan(m_layout.signature.offset,
                                                                   m_layout.signature.width) };
    fields.signature.assign(sig.begin(), sig.end());
    return fields;
}

[[nodiscard]] std::span<const std::uint8_t> Codec::prefix(const IdentifierBytes& bytes) const noexcept
{
    return std::span<const std::uint8_t>{ bytes }.first(m_layout.prefixBytes());
}

[[nodiscard]] std::span<const std::uint8_t> Codec::randomField(const IdentifierBytes& bytes) const noexcept
{
    return std::span<const std::uint8_t>{ bytes }.subspan(m_layout.random.offset, m_layout.random.width);
}

} // namespace sigid::core
