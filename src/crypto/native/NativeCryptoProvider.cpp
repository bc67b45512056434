#include "sigid/crypto/providers/NativeProviderFactory.hpp"
#include "sigid/security/ScopeWipe.hpp"
#include "sigid/security/SecureBuffer.hpp"
#include "sigid/security/SecureRandom.hpp"
#include "monocypher.h"
#include <cstddef>
#include <cstdint>
#include <span>

namespace sigid::crypto::providers
{
namespace
{

class NativeCryptoProvider final : public sigid::crypto::ICryptoProvider
{
public:
    // Plain (unkeyed) BLAKE2b over the concatenation, mirroring the SHA-256 provider's construction.
    [[nodiscard]] sigid::security::SecureBuffer keyedDigest(std::span<const std::uint8_t> key,
                                                            std::span<const std::uint8_t> message) const override
    {
        sigid::security::SecureBuffer out{};
        out.resize(sigid::crypto::g_digestBytes);

        crypto_blake2b_ctx ctx{};
        const sigid::security::ScopeWipe wipeCtx{ sigid::security::objectBytes(ctx) };
        crypto_blake2b_init(&ctx, out.size());
        crypto_blake2b_update(&ctx, key.data(), key.size());
        crypto_blake2b_update(&ctx, message.data(), message.size());
        crypto_blake2b_final(&ctx, out.data());

        return out;
    }

    [[nodiscard]] sigid::crypto::DigestAlgorithm digestAlgorithm() const noexcept override
    {
        return sigid::crypto::DigestAlgorithm::Blake2b256;
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return sigid::security::secureRandomFill(out);
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<sigid::crypto::ICryptoProvider> makeNativeCryptoProvider()
{
    return std::make_unique<NativeCryptoProvider>();
}

} // namespace sigid::crypto::providers
