#ifndef INCLUDE_SIGID_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_SIGID_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "sigid/crypto/ICryptoProvider.hpp"
#include <memory>

namespace sigid::crypto::providers
{

// SHA-256 over key || message (OpenSSL EVP), OS CSPRNG for random bytes.
[[nodiscard]] std::unique_ptr<sigid::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace sigid::crypto::providers

#endif // INCLUDE_SIGID_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
