#ifndef INCLUDE_SIGID_CORE_SIGNER_HPP
#define INCLUDE_SIGID_CORE_SIGNER_HPP

#include "sigid/core/Codec.hpp"
#include "sigid/core/Registry.hpp"
#include "sigid/crypto/ICryptoProvider.hpp"
#include "sigid/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace sigid::core
{

// Computes and checks the truncated keyed signature over an identifier prefix.
// A 1-2 byte signature only filters foreign identifiers; it is not an authentication tag.
class Signer final
{
public:
    Signer(const Registry& registry, const sigid::crypto::ICryptoProvider& crypto) noexcept;

    // Full digest of secret(secretId) || prefix. Throws std::out_of_range for an unregistered secret.
    [[nodiscard]] sigid::security::SecureBuffer sign(std::span<const std::uint8_t> prefix,
                                                     std::uint8_t secretId) const;

    // First signatureBytes bytes of the digest, in digest order.
    [[nodiscard]] static Signature truncate(std::span<const std::uint8_t> digest, std::size_t signatureBytes);

    // False for an unregistered secret or a signature of the wrong length; never signs with a missing secret.
    [[nodiscard]] bool verify(std::span<const std::uint8_t> prefix, std::uint8_t secretId,
                              std::span<const std::uint8_t> storedSignature) const;

private:
    const Registry* m_registry{ nullptr };
    const sigid::crypto::ICryptoProvider* m_crypto{ nullptr };
};

} // namespace sigid::core

#endif // INCLUDE_SIGID_CORE_SIGNER_HPP
