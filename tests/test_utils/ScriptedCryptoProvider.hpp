#ifndef SIGID_TESTS_TEST_UTILS_SCRIPTEDCRYPTOPROVIDER_HPP
#define SIGID_TESTS_TEST_UTILS_SCRIPTEDCRYPTOPROVIDER_HPP

#include "sigid/crypto/ICryptoProvider.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace sigid::test_utils
{

// Digests through a real provider; random bytes come from a fixed script.
// randomBytes() fails once the script runs out or when failRandom is set.
class ScriptedCryptoProvider final : public sigid::crypto::ICryptoProvider
{
public:
    explicit ScriptedCryptoProvider(const sigid::crypto::ICryptoProvider& digest) : m_digest{ &digest }
    {
    }

    void script(std::vector<std::uint8_t> bytes)
    {
        m_script = std::move(bytes);
        m_cursor = 0U;
    }

    void failRandom(bool fail) noexcept
    {
        m_failRandom = fail;
    }

    [[nodiscard]] std::size_t randomBytesConsumed() const noexcept
    {
        return m_cursor;
    }

    [[nodiscard]] sigid::security::SecureBuffer keyedDigest(std::span<const std::uint8_t> key,
                                                            std::span<const std::uint8_t> message) const override
    {
        return m_digest->keyedDigest(key, message);
    }

    [[nodiscard]] sigid::crypto::DigestAlgorithm digestAlgorithm() const noexcept override
    {
        return m_digest->digestAlgorithm();
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        if (m_failRandom || out.size() > m_script.size() - m_cursor)
        {
            return false;
        }
        for (auto& b : out)
        {
            b = m_script[m_cursor++];
        }
        return true;
    }

private:
    const sigid::crypto::ICryptoProvider* m_digest{ nullptr };
    std::vector<std::uint8_t> m_script;
    std::size_t m_cursor{ 0U };
    bool m_failRandom{ false };
};

} // namespace sigid::test_utils

#endif // SIGID_TESTS_TEST_UTILS_SCRIPTEDCRYPTOPROVIDER_HPP
