#ifndef INCLUDE_SIGID_CORE_REGISTRY_HPP
#define INCLUDE_SIGID_CORE_REGISTRY_HPP

#include "sigid/core/IdentifierLayout.hpp"
#include "sigid/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace sigid::core
{

constexpr std::size_t g_maxSecrets{ 256U };
constexpr std::size_t g_maxTypes{ 255U };

constexpr std::string_view g_untypedDescription{ "Untyped" };
constexpr std::string_view g_unknownTypeDescription{ "Unknown" };

// secretId -> secret material. The string's bytes are used verbatim as the digest key.
using SecretMap = std::map<int, std::string>;
// typeId -> human-readable description.
using TypeMap = std::map<int, std::string>;

// Immutable secret and type tables plus the chosen signature width.
// Rotating a secret value invalidates every identifier signed with the old value.
class Registry final
{
public:
    // Throws ConfigError on more than 256 secrets or 255 types, a secret id outside [0, 255],
    // a type id outside [0, 254], or signatureBytes outside [1, 4].
    Registry(const SecretMap& secrets, const TypeMap& types,
             int signatureBytes = static_cast<int>(g_defaultSignatureBytes));

    // nullptr when the id is not registered.
    [[nodiscard]] const sigid::security::SecureBuffer* findSecret(std::uint8_t secretId) const noexcept;
    [[nodiscard]] bool hasSecret(std::uint8_t secretId) const noexcept;

    [[nodiscard]] bool hasType(int typeId) const noexcept;

    // "Untyped" for 255, the registered description, or "Unknown".
    [[nodiscard]] std::string_view typeDescription(std::uint8_t typeId) const noexcept;

    // Registered secret ids in ascending order.
    [[nodiscard]] const std::vector<std::uint8_t>& secretIds() const noexcept;

    // Field offsets derive from this through Codec.
    [[nodiscard]] std::size_t signatureBytes() const noexcept;
    // 8 - signatureBytes.
    [[nodiscard]] std::size_t randomBytes() const noexcept;

private:
    std::map<std::uint8_t, sigid::security::SecureBuffer> m_secrets;
    std::map<std::uint8_t, std::string> m_types;
    std::vector<std::uint8_t> m_secretIds;
    std::size_t m_signatureBytes{ g_defaultSignatureBytes };
};

} // namespace sigid::core

#endif // INCLUDE_SIGID_CORE_REGISTRY_HPP
