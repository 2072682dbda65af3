#ifndef INCLUDE_COKACENC_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_COKACENC_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "cokacenc/crypto/ICryptoProvider.hpp"
#include <memory>

namespace cokacenc::crypto::providers
{

[[nodiscard]] std::unique_ptr<cokacenc::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace cokacenc::crypto::providers

#endif // INCLUDE_COKACENC_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
