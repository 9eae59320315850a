#pragma once
#include "realmauth/constants.hpp"
#include <openssl/types.h>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace realmauth {

/// RSA keypair. The public half is always derived from the private key.
/// Using a moved-from Keypair throws std::logic_error.
class Keypair {
public:
    /// Generate a fresh RSA key from the OpenSSL CSPRNG
    /// @throws CryptoError if key generation fails
    [[nodiscard]] static Keypair generate(int bits = RSA_KEY_BITS);

    /// Parse an unencrypted RSA private key, PKCS#1 or PKCS#8 PEM
    /// @throws CryptoError if the input is not an RSA private key
    [[nodiscard]] static Keypair fromPrivateKeyPem(std::string_view pem);

    /// Read and parse a PEM private key file
    /// @throws std::runtime_error if the file cannot be read
    /// @throws CryptoError if the content is not an RSA private key
    [[nodiscard]] static Keypair fromPrivateKeyFile(const std::filesystem::path& path);

    Keypair(Keypair&& other) noexcept;
    Keypair& operator=(Keypair&& other) noexcept;
    ~Keypair();

    /// Modulus size in bits
    [[nodiscard]] int bits() const;

    /// PKCS#1 private key, PEM block "RSA PRIVATE KEY"
    [[nodiscard]] std::string privateKeyPem() const;

    /// PKIX SubjectPublicKeyInfo, PEM block "PUBLIC KEY"
    [[nodiscard]] std::string publicKeyPem() const;

    /// RSASSA-PKCS1-v1_5 signature over SHA-256 (RS256)
    [[nodiscard]] std::vector<std::uint8_t> sign(std::span<const std::uint8_t> data) const;

private:
    class Impl;
    explicit Keypair(std::unique_ptr<Impl> impl);
    EVP_PKEY* key() const;
    std::unique_ptr<Impl> impl_;
};

/// Paths of the two PEM files written for a realm
struct KeypairFiles {
    std::filesystem::path privateKey;
    std::filesystem::path publicKey;
};

/// Write <realm>_private.pem and <realm>_public.pem into directory,
/// truncating existing files. The private key is written first; a failure on
/// the public key leaves the private key file in place.
/// @throws std::invalid_argument if realmName is empty
/// @throws std::runtime_error if a file cannot be written
KeypairFiles writeRealmKeypair(const Keypair& keypair,
                               const std::string& realmName,
                               const std::filesystem::path& directory = ".");

/// Generate a RSA_KEY_BITS keypair for a realm and write it to directory
[[nodiscard]] KeypairFiles generateRealmKeypair(const std::string& realmName,
                                                const std::filesystem::path& directory = ".");

} // namespace realmauth
