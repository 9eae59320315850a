#pragma once

#include "realmauth/errors.hpp"
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace realmauth::internal {

// Owning handles for OpenSSL objects
struct EvpPkeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
struct EvpPkeyCtxDeleter { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
struct EvpMdCtxDeleter { void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); } };
struct BioDeleter { void operator()(BIO* p) const { BIO_free_all(p); } };

using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, EvpPkeyDeleter>;
using EvpPkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

/// Build a CryptoError from a context string and the drained OpenSSL
/// error queue: "<what>: <error>; <error>"
[[nodiscard]] CryptoError opensslError(const std::string& what);

/// Fill the buffer from the OpenSSL CSPRNG
/// @throws CryptoError if the generator fails
void secureRandomBytes(std::span<std::uint8_t> out);

/// Copy the content of a memory BIO into a string
[[nodiscard]] std::string bioToString(BIO* bio);

} // namespace realmauth::internal
