#include "sigid/core/IdentifierService.hpp"

#include "sigid/core/Errors.hpp"
#include "sigid/security/SecureRandom.hpp"
#include <array>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>

namespace sigid::core
{

IdentifierService::IdentifierService(Registry registry, sigid::crypto::ICryptoProvider& crypto,
                                     NowProvider nowProvider)
    : m_registry(std::move(registry)), m_crypto(&crypto), m_now(std::move(nowProvider)),
      m_codec(m_registry.signatureBytes()), m_signer(m_registry, crypto)
{
}

Identifier IdentifierService::generate()
{
    return generate(static_cast<int>(g_untypedTypeId));
}

Identifier IdentifierService::generate(int typeId)
{
    if (typeId != static_cast<int>(g_untypedTypeId) && !m_registry.hasType(typeId))
    {
        throw InvalidTypeError("generate: unknown type: " + std::to_string(typeId));
    }
    if (m_registry.secretIds().empty())
    {
        throw std::logic_error("generate: registry holds no secrets");
    }

    const std::uint64_t timestampMs{ nowMs() };

    std::array<std::uint8_t, g_maxRandomBytes> randomScratch{};
    const auto random{ std::span<std::uint8_t>{ randomScratch }.first(m_codec.layout().random.width) };
    if (!m_crypto->randomBytes(random))
    {
        throw std::runtime_error("generate: CSPRNG failure");
    }

    const std::uint8_t secretId{ pickSecretId() };

    IdentifierBytes bytes{ m_codec.packPrefix(timestampMs, random, static_cast<std::uint8_t>(typeId), secretId) };
    const sigid::security::SecureBuffer digest{ m_signer.sign(m_codec.prefix(bytes), secretId) };
    m_codec.writeSignature(bytes, Signer::truncate(sigid::security::asSpan(digest), m_registry.signatureBytes()));

    return toIdentifierValue(bytes);
}

DecodedInfo IdentifierService::decode(const Identifier& id) const
{
    const IdentifierBytes bytes{ fromIdentifierValue(id) };
    UnpackedIdentifier fields{ m_codec.unpack(bytes) };

    DecodedInfo info{};
    info.timestampMs = fields.timestampMs;
    info.typeId = fields.typeId;
    info.typeDesc = std::string{ m_registry.typeDescription(fields.typeId) };
    info.secretId = fields.secretId;
    info.valid = m_signer.verify(m_codec.prefix(bytes), fields.secretId, fields.signature);
    info.signature = std::move(fields.signature);
    return info;
}

const Registry& IdentifierService::registry() const noexcept
{
    return m_registry;
}

std::uint64_t IdentifierService::nowMs() const
{
    const auto sinceEpoch{ std::chrono::duration_cast<std::chrono::milliseconds>(m_now().time_since_epoch()) };
    // Pre-epoch clocks wrap like any other out-of-range value; only the low 48 bits are kept.
    return static_cast<std::uint64_t>(sinceEpoch.count()) & g_timestampMask;
}

std::uint8_t IdentifierService::pickSecretId()
{
    const auto& ids{ m_registry.secretIds() };
    auto fill{ [this](std::span<std::uint8_t> out) noexcept { return m_crypto->randomBytes(out); } };

    std::uint64_t index{};
    if (!sigid::security::randomBelow(fill, ids.size(), index))
    {
        throw std::runtime_error("generate: CSPRNG failure");
    }
    return ids[static_cast<std::size_t>(index)];
}

} // namespace sigid::core
