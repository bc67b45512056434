#include "sigid/crypto/providers/OpenSslProviderFactory.hpp"
#include "sigid/security/SecureBuffer.hpp"
#include "sigid/security/SecureRandom.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <openssl/evp.h>
#include <span>
#include <stdexcept>

namespace sigid::crypto::providers
{
namespace
{

using EvpMdPtr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

EvpMdPtr fetchSha256()
{
    return EvpMdPtr{ EVP_MD_fetch(nullptr, "SHA2-256", nullptr), &EVP_MD_free };
}

class OpenSslCryptoProvider final : public sigid::crypto::ICryptoProvider
{
public:
    OpenSslCryptoProvider() : m_sha256{ fetchSha256() }
    {
    }

    // The fetched EVP_MD is immutable and shareable; the EVP_MD_CTX is per call.
    [[nodiscard]] sigid::security::SecureBuffer keyedDigest(std::span<const std::uint8_t> key,
                                                            std::span<const std::uint8_t> message) const override
    {
        if (!m_sha256)
        {
            throw std::runtime_error("keyedDigest: OpenSSL SHA-256 not available");
        }

        EvpMdCtxPtr ctx{ EVP_MD_CTX_new(), &EVP_MD_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("keyedDigest: EVP_MD_CTX_new failed");
        }
        if (EVP_DigestInit_ex2(ctx.get(), m_sha256.get(), nullptr) != 1)
        {
            throw std::runtime_error("keyedDigest: EVP_DigestInit_ex2 failed");
        }
        if (!key.empty() && EVP_DigestUpdate(ctx.get(), key.data(), key.size()) != 1)
        {
            throw std::runtime_error("keyedDigest: EVP_DigestUpdate(key) failed");
        }
        if (!message.empty() && EVP_DigestUpdate(ctx.get(), message.data(), message.size()) != 1)
        {
            throw std::runtime_error("keyedDigest: EVP_DigestUpdate(message) failed");
        }

        sigid::security::SecureBuffer out{};
        out.resize(sigid::crypto::g_digestBytes);
        unsigned int written{ 0U };
        if (EVP_DigestFinal_ex(ctx.get(), out.data(), &written) != 1 || written != out.size())
        {
            throw std::runtime_error("keyedDigest: EVP_DigestFinal_ex failed");
        }
        return out;
    }

    [[nodiscard]] sigid::crypto::DigestAlgorithm digestAlgorithm() const noexcept override
    {
        return sigid::crypto::DigestAlgorithm::Sha256;
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return sigid::security::secureRandomFill(out);
    }

private:
    EvpMdPtr m_sha256{ nullptr, &EVP_MD_free };
};

} // namespace

[[nodiscard]] std::unique_ptr<sigid::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace sigid::crypto::providers
