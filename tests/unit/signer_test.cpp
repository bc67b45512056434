#include "sigid/core/Signer.hpp"
#include "sigid/crypto/providers/OpenSslProviderFactory.hpp"

#include "test_utils/TestUtils.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <vector>

using sigid::core::Registry;
using sigid::core::SecretMap;
using sigid::core::Signer;
using sigid::core::TypeMap;
using ::testing::ElementsAre;

namespace
{

// SHA-256("beta" || prefix) for the prefix below.
constexpr const char* g_kPrefixHex{ "01923456789a0102030405060a01" };
constexpr const char* g_kBetaDigestHex{ "757fda50e514c1543e2c59b42620de389571eb06ab36f17ab6bcfc2fffdec6cf" };

class SignerTest : public ::testing::Test
{
protected:
    std::unique_ptr<sigid::crypto::ICryptoProvider> m_crypto{
        sigid::crypto::providers::makeOpenSslCryptoProvider()
    };                                                                                           // NOLINT
    Registry m_registry{ SecretMap{ { 0, "alpha" }, { 1, "beta" } }, TypeMap{ { 10, "USER" } } }; // NOLINT
    Signer m_signer{ m_registry, *m_crypto };                                                    // NOLINT
    std::vector<std::uint8_t> m_prefix{ sigid::test_utils::fromHex(g_kPrefixHex) };              // NOLINT
};

} // namespace

TEST_F(SignerTest, SignHashesSecretThenPrefix)
{
    const auto digest{ m_signer.sign(m_prefix, 1U) };
    EXPECT_EQ(sigid::test_utils::toHex(sigid::security::asSpan(digest)), g_kBetaDigestHex);
}

TEST_F(SignerTest, SignRejectsUnknownSecret)
{
    EXPECT_THROW((void)m_signer.sign(m_prefix, 9U), std::out_of_range);
}

TEST_F(SignerTest, TruncateKeepsLeadingBytesInOrder)
{
    const std::vector<std::uint8_t> digest{ 0x75, 0x7F, 0xDA, 0x50, 0xE5 };
    EXPECT_THAT(Signer::truncate(digest, 1U), ElementsAre(0x75));
    EXPECT_THAT(Signer::truncate(digest, 4U), ElementsAre(0x75, 0x7F, 0xDA, 0x50));
    EXPECT_THROW((void)Signer::truncate(digest, 6U), std::invalid_argument);
}

TEST_F(SignerTest, VerifyAcceptsMatchingSignature)
{
    const std::vector<std::uint8_t> stored{ 0x75, 0x7F };
    EXPECT_TRUE(m_signer.verify(m_prefix, 1U, stored));
}

TEST_F(SignerTest, VerifyRejectsWrongSignatureOrSecret)
{
    EXPECT_FALSE(m_signer.verify(m_prefix, 1U, std::vector<std::uint8_t>{ 0x75, 0x7E }));
    EXPECT_FALSE(m_signer.verify(m_prefix, 0U, std::vector<std::uint8_t>{ 0x75, 0x7F }));
}

TEST_F(SignerTest, VerifyFailsClosedOnUnknownSecret)
{
    EXPECT_FALSE(m_signer.verify(m_prefix, 42U, std::vector<std::uint8_t>{ 0x75, 0x7F }));
}

TEST_F(SignerTest, VerifyRejectsSignatureOfWrongWidth)
{
    EXPECT_FALSE(m_signer.verify(m_prefix, 1U, std::vector<std::uint8_t>{ 0x75 }));
    EXPECT_FALSE(m_signer.verify(m_prefix, 1U, std::vector<std::uint8_t>{ 0x75, 0x7F, 0xDA }));
}
