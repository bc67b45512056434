#ifndef INCLUDE_SIGID_CORE_IDENTIFIERSERVICE_HPP
#define INCLUDE_SIGID_CORE_IDENTIFIERSERVICE_HPP

#include "sigid/core/Codec.hpp"
#include "sigid/core/Identifier.hpp"
#include "sigid/core/Registry.hpp"
#include "sigid/core/Signer.hpp"
#include "sigid/crypto/ICryptoProvider.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace sigid::core
{

struct DecodedInfo final
{
    bool valid{ false };
    std::uint64_t timestampMs{ 0U };
    Signature signature;
    std::uint8_t typeId{ 0U };
    std::string typeDesc;
    std::uint8_t secretId{ 0U };
};

// Mints and checks identifiers for one issuer. Owns its Registry; borrows the crypto provider,
// which must outlive the service. generate() and decode() may run concurrently from any thread
// as long as the provider's randomBytes() and keyedDigest() are thread-safe (both shipped providers are).
class IdentifierService final
{
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;
    using NowProvider = std::function<TimePoint()>;

    IdentifierService(Registry registry, sigid::crypto::ICryptoProvider& crypto, NowProvider nowProvider = Clock::now);

    IdentifierService(const IdentifierService&) = delete;
    IdentifierService& operator=(const IdentifierService&) = delete;
    IdentifierService(IdentifierService&&) = delete;
    IdentifierService& operator=(IdentifierService&&) = delete;
    ~IdentifierService() = default;

    // Untyped identifier (typeId 255).
    [[nodiscard]] Identifier generate();

    // Throws InvalidTypeError unless typeId is registered or 255, std::logic_error when the
    // registry holds no secrets, std::runtime_error when the random source fails.
    [[nodiscard]] Identifier generate(int typeId);

    // Every 128-bit value decodes; a foreign or corrupted identifier yields valid == false.
    // Only a failing digest backend throws.
    [[nodiscard]] DecodedInfo decode(const Identifier& id) const;

    [[nodiscard]] const Registry& registry() const noexcept;

private:
    [[nodiscard]] std::uint64_t nowMs() const;
    [[nodiscard]] std::uint8_t pickSecretId();

    Registry m_registry;
    sigid::crypto::ICryptoProvider* m_crypto{ nullptr };
    NowProvider m_now;
    Codec m_codec;
    Signer m_signer;
};

} // namespace sigid::core

#endif // INCLUDE_SIGID_CORE_IDENTIFIERSERVICE_HPP
