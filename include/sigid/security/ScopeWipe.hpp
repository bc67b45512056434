#ifndef INCLUDE_SIGID_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_SIGID_SECURITY_SCOPEWIPE_HPP

#include "sigid/security/MemoryWiper.hpp"
#include <cstddef>
#include <span>

namespace sigid::security
{
// Wipes a stack object (digest context, scratch array) when the scope ends.
// Pair with objectBytes() for single objects.
class [[nodiscard]] ScopeWipe final
{
public:
    explicit ScopeWipe(std::span<std::byte> bytes) noexcept : m_bytes{ bytes }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;
    ScopeWipe(ScopeWipe&&) = delete;
    ScopeWipe& operator=(ScopeWipe&&) = delete;

    ~ScopeWipe() noexcept
    {
        if (!m_bytes.empty())
        {
            secureWipe(m_bytes);
        }
    }

private:
    std::span<std::byte> m_bytes;
};

} // namespace sigid::security

#endif // INCLUDE_SIGID_SECURITY_SCOPEWIPE_HPP
