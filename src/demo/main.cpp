#include "sigid/core/Identifier.hpp"
#include "sigid/core/IdentifierService.hpp"
#include "sigid/core/Registry.hpp"
#include "sigid/crypto/providers/OpenSslProviderFactory.hpp"
#include <cstdint>
#include <exception>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#if defined(SIGID_ENABLE_NATIVE)
#include "sigid/crypto/providers/NativeProviderFactory.hpp"
#endif

namespace
{

constexpr int g_kUserTypeId{ 10 };

std::string toHex(std::span<const std::uint8_t> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";
    constexpr std::uint8_t kNibbleShift{ 4U };
    constexpr std::uint8_t kNibbleMask{ 0x0FU };

    std::string out{};
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kHex[(b >> kNibbleShift) & kNibbleMask]);
        out.push_back(kHex[b & kNibbleMask]);
    }
    return out;
}

void printDecoded(std::string_view label, const sigid::core::Identifier& id, const sigid::core::DecodedInfo& info)
{
    std::cout << label << ": " << sigid::core::formatIdentifier(id) << "\n"
              << "  valid=" << (info.valid ? "true" : "false") << " timestampMs=" << info.timestampMs
              << " typeId=" << static_cast<int>(info.typeId) << " (" << info.typeDesc << ")"
              << " secretId=" << static_cast<int>(info.secretId)
              << " signature=" << toHex(std::span<const std::uint8_t>{ info.signature }) << "\n";
}

void runScenario(std::string_view name, sigid::crypto::ICryptoProvider& crypto)
{
    std::cout << "== " << name << " ==\n";

    sigid::core::Registry registry{ sigid::core::SecretMap{ { 0, "alpha" }, { 1, "beta" } },
                                    sigid::core::TypeMap{ { g_kUserTypeId, "USER" } } };
    sigid::core::IdentifierService service{ std::move(registry), crypto };

    const auto typed{ service.generate(g_kUserTypeId) };
    printDecoded("typed", typed, service.decode(typed));

    const auto untyped{ service.generate() };
    printDecoded("untyped", untyped, service.decode(untyped));

    auto tampered{ typed };
    tampered.leastSignificantBits ^= 1U;
    printDecoded("tampered", tampered, service.decode(tampered));

    printDecoded("zero", sigid::core::Identifier{}, service.decode(sigid::core::Identifier{}));
}

} // namespace

int main()
{
    try
    {
        auto openssl{ sigid::crypto::providers::makeOpenSslCryptoProvider() };
        runScenario("openssl (sha-256)", *openssl);

#if defined(SIGID_ENABLE_NATIVE)
        auto native{ sigid::crypto::providers::makeNativeCryptoProvider() };
        runScenario("native (blake2b-256)", *native);
#endif

        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
