#ifndef INCLUDE_SIGID_CORE_CODEC_HPP
#define INCLUDE_SIGID_CORE_CODEC_HPP

#include "sigid/core/Identifier.hpp"
#include "sigid/core/IdentifierLayout.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace sigid::core
{

using Signature = std::vector<std::uint8_t>;

struct UnpackedIdentifier final
{
    std::uint64_t timestampMs{ 0U };
    std::uint8_t typeId{ 0U };
    std::uint8_t secretId{ 0U };
    Signature signature;
};

class Codec final
{
public:
    // Throws std::invalid_argument when signatureBytes is outside [1, 4].
    explicit Codec(std::size_t signatureBytes);

    [[nodiscard]] const IdentifierLayout& layout() const noexcept;

    // Writes everything but the signature; the signature bytes are left zero.
    // The timestamp is truncated to its low 48 bits.
    [[nodiscard]] IdentifierBytes packPrefix(std::uint64_t timestampMs, std::span<const std::uint8_t> random,
                                             std::uint8_t typeId, std::uint8_t secretId) const;

    void writeSignature(IdentifierBytes& bytes, std::span<const std::uint8_t> signature) const;

    [[nodiscard]] IdentifierBytes pack(std::uint64_t timestampMs, std::span<const std::uint8_t> random,
                                       std::uint8_t typeId, std::uint8_t secretId,
                                       std::span<const std::uint8_t> signature) const;

    // Any 16 bytes unpack; whether they are authentic is decided by the Signer.
    [[nodiscard]] UnpackedIdentifier unpack(const IdentifierBytes& bytes) const;

    [[nodiscard]] std::span<const std::uint8_t> prefix(const IdentifierBytes& bytes) const noexcept;
    [[nodiscard]] std::span<const std::uint8_t> randomField(const IdentifierBytes& bytes) const noexcept;

private:
    IdentifierLayout m_layout;
};

} // namespace sigid::core

#endif // INCLUDE_SIGID_CORE_CODEC_HPP
