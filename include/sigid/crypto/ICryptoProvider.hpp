#ifndef INCLUDE_SIGID_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_SIGID_CRYPTO_ICRYPTOPROVIDER_HPP

#include "sigid/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace sigid::crypto
{

constexpr std::size_t g_digestBytes{ 32U };

enum class DigestAlgorithm : std::uint8_t
{
    Sha256,
    Blake2b256,
};

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // Full-width digest of key || message. Every call owns its digest context, so concurrent
    // callers never share hashing state. Library failures throw std::runtime_error.
    [[nodiscard]] virtual sigid::security::SecureBuffer keyedDigest(std::span<const std::uint8_t> key,
                                                                    std::span<const std::uint8_t> message) const = 0;

    [[nodiscard]] virtual DigestAlgorithm digestAlgorithm() const noexcept = 0;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;
};

} // namespace sigid::crypto

#endif // INCLUDE_SIGID_CRYPTO_ICRYPTOPROVIDER_HPP
