#ifndef INCLUDE_SIGID_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
#define INCLUDE_SIGID_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP

#include "sigid/crypto/ICryptoProvider.hpp"
#include <memory>

namespace sigid::crypto::providers
{

// BLAKE2b-256 over key || message (Monocypher), OS CSPRNG for random bytes.
[[nodiscard]] std::unique_ptr<sigid::crypto::ICryptoProvider> makeNativeCryptoProvider();

} // namespace sigid::crypto::providers

#endif // INCLUDE_SIGID_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
