#include "sigid/core/Signer.hpp"

#include "sigid/security/SecureEquals.hpp"
#include <stdexcept>

namespace sigid::core
{

Signer::Signer(const Registry& registry, const sigid::crypto::ICryptoProvider& crypto) noexcept
    : m_registry{ &registry }, m_crypto{ &crypto }
{
}

[[nodiscard]] sigid::security::SecureBuffer Signer::sign(std::span<const std::uint8_t> prefix,
                                                         std::uint8_t secretId) const
{
    const sigid::security::SecureBuffer* secret{ m_registry->findSecret(secretId) };
    if (secret == nullptr)
    {
        throw std::out_of_range("sign: unknown secretId");
    }
    return m_crypto->keyedDigest(sigid::security::asSpan(*secret), prefix);
}

[[nodiscard]] Signature Signer::truncate(std::span<const std::uint8_t> digest, std::size_t signatureBytes)
{
    if (digest.size() < signatureBytes)
    {
        throw std::invalid_argument("truncate: digest shorter than signature");
    }
    const auto head{ digest.first(signatureBytes) };
    return Signature(head.begin(), head.end());
}

[[nodiscard]] bool Signer::verify(std::span<const std::uint8_t> prefix, std::uint8_t secretId,
                                  std::span<const std::uint8_t> storedSignature) const
{
    if (!m_registry->hasSecret(secretId))
    {
        return false;
    }
    if (storedSignature.size() != m_registry->signatureBytes())
    {
        return false;
    }

    const sigid::security::SecureBuffer digest{ sign(prefix, secretId) };
    const Signature expected{ truncate(sigid::security::asSpan(digest), storedSignature.size()) };
    return sigid::security::secureEquals(std::span<const std::uint8_t>{ expected }, storedSignature);
}

} // namespace sigid::core
