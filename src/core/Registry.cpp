#include "sigid/core/Registry.hpp"

#include "sigid/core/Errors.hpp"
#include <string>

namespace sigid::core
{
namespace
{

constexpr int g_kMaxSecretId{ static_cast<int>(g_maxSecrets) - 1 };
constexpr int g_kMaxTypeId{ static_cast<int>(g_maxTypes) - 1 };

void requireConfigValid(const SecretMap& secrets, const TypeMap& types, int signatureBytes)
{
    if (secrets.size() > g_maxSecrets)
    {
        throw ConfigError("Registry: too many secrets (max 256)");
    }
    if (types.size() > g_maxTypes)
    {
        throw ConfigError("Registry: too many types (max 255)");
    }
    for (const auto& [id, secret] : secrets)
    {
        if (id < 0 || id > g_kMaxSecretId)
        {
            throw ConfigError("Registry: secret id out of range: " + std::to_string(id));
        }
    }
    for (const auto& [id, description] : types)
    {
        if (id < 0 || id > g_kMaxTypeId)
        {
            throw ConfigError("Registry: type id out of range: " + std::to_string(id));
        }
    }
    if (signatureBytes < static_cast<int>(g_minSignatureBytes) ||
        signatureBytes > static_cast<int>(g_maxSignatureBytes))
    {
        throw ConfigError("Registry: signatureBytes must be within [1, 4]");
    }
}

} // namespace

Registry::Registry(const SecretMap& secrets, const TypeMap& types, int signatureBytes)
{
    requireConfigValid(secrets, types, signatureBytes);

    for (const auto& [id, secret] : secrets)
    {
        const auto secretId{ static_cast<std::uint8_t>(id) };
        m_secrets.emplace(secretId, sigid::security::secureBufferFrom(secret));
        m_secretIds.push_back(secretId);
    }
    for (const auto& [id, description] : types)
    {
        m_types.emplace(static_cast<std::uint8_t>(id), description);
    }

    m_signatureBytes = static_cast<std::size_t>(signatureBytes);
}

const sigid::security::SecureBuffer* Registry::findSecret(std::uint8_t secretId) const noexcept
{
    const auto it{ m_secrets.find(secretId) };
    return (it == m_secrets.end()) ? nullptr : &it->second;
}

bool Registry::hasSecret(std::uint8_t secretId) const noexcept
{
    return m_secrets.contains(secretId);
}

bool Registry::hasType(int typeId) const noexcept
{
    if (typeId < 0 || typeId > g_kMaxTypeId)
    {
        return false;
    }
    return m_types.contains(static_cast<std::uint8_t>(typeId));
}

std::string_view Registry::typeDescription(std::uint8_t typeId) const noexcept
{
    if (typeId == g_untypedTypeId)
    {
        return g_untypedDescription;
    }
    const auto it{ m_types.find(typeId) };
    return (it == m_types.end()) ? g_unknownTypeDescription : std::string_view{ it->second };
}

const std::vector<std::uint8_t>& Registry::secretIds() const noexcept
{
    return m_secretIds;
}

std::size_t Registry::signatureBytes() const noexcept
{
    return m_signatureBytes;
}

std::size_t Registry::randomBytes() const noexcept
{
    return g_randomAndSignatureBytes - m_signatureBytes;
}

} // namespace sigid::core
