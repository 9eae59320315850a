#include "realmauth/keypair.hpp"
#include "realmauth/errors.hpp"
#include "openssl_utils.hpp"
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <climits>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace realmauth {

using namespace internal;

namespace {
    // Refuse encrypted keys instead of prompting on the terminal
    int noPassphrase(char*, int, int, void*) {
        return 0;
    }

    std::string readFile(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Cannot open file: " + path.string());
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    void writeFile(const std::filesystem::path& path, const std::string& content) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Cannot write to file: " + path.string());
        }
        file << content;
        file.flush();
        if (!file) {
            throw std::runtime_error("Failed writing file: " + path.string());
        }
    }
}

class Keypair::Impl {
public:
    EvpPkeyPtr pkey_;
};

Keypair::Keypair(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

Keypair::Keypair(Keypair&& other) noexcept = default;
Keypair& Keypair::operator=(Keypair&& other) noexcept = default;
Keypair::~Keypair() = default;

Keypair Keypair::generate(int bits) {
    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!ctx) {
        throw opensslError("Cannot create RSA key generation context");
    }
    if (EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        throw opensslError("Cannot initialize RSA key generation");
    }
    if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0) {
        throw opensslError("Cannot set RSA key size to " + std::to_string(bits));
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
        throw opensslError("RSA key generation failed");
    }

    auto impl = std::make_unique<Impl>();
    impl->pkey_.reset(raw);
    return Keypair(std::move(impl));
}

Keypair Keypair::fromPrivateKeyPem(std::string_view pem) {
    if (pem.empty()) {
        throw CryptoError("Private key PEM is empty");
    }
    if (pem.size() > static_cast<std::size_t>(INT_MAX)) {
        throw CryptoError("Private key PEM is too large");
    }

    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw opensslError("Cannot allocate buffer for private key");
    }

    // Accepts both "RSA PRIVATE KEY" (PKCS#1) and "PRIVATE KEY" (PKCS#8)
    EvpPkeyPtr pkey(PEM_read_bio_PrivateKey(bio.get(), nullptr, noPassphrase, nullptr));
    if (!pkey) {
        throw opensslError("Cannot parse RSA private key");
    }
    if (EVP_PKEY_base_id(pkey.get()) != EVP_PKEY_RSA) {
        throw CryptoError("Private key is not an RSA key");
    }

    auto impl = std::make_unique<Impl>();
    impl->pkey_ = std::move(pkey);
    return Keypair(std::move(impl));
}

Keypair Keypair::fromPrivateKeyFile(const std::filesystem::path& path) {
    return fromPrivateKeyPem(readFile(path));
}

EVP_PKEY* Keypair::key() const {
    if (!impl_ || !impl_->pkey_) {
        throw std::logic_error("Keypair has been moved from");
    }
    return impl_->pkey_.get();
}

int Keypair::bits() const {
    return EVP_PKEY_bits(key());
}

std::string Keypair::privateKeyPem() const {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw opensslError("Cannot allocate buffer for private key");
    }
    // The traditional form of an RSA key is PKCS#1
    if (PEM_write_bio_PrivateKey_traditional(bio.get(), key(),
                                             nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        throw opensslError("Cannot encode private key");
    }
    return bioToString(bio.get());
}

std::string Keypair::publicKeyPem() const {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio) {
        throw opensslError("Cannot allocate buffer for public key");
    }
    if (PEM_write_bio_PUBKEY(bio.get(), key()) != 1) {
        throw opensslError("Cannot encode public key");
    }
    return bioToString(bio.get());
}

std::vector<std::uint8_t> Keypair::sign(std::span<const std::uint8_t> data) const {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw opensslError("Cannot create signing context");
    }
    if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key()) != 1) {
        throw opensslError("Cannot initialize RS256 signing");
    }

    std::size_t sig_len = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &sig_len, data.data(), data.size()) != 1) {
        throw opensslError("Cannot determine signature size");
    }

    std::vector<std::uint8_t> signature(sig_len);
    if (EVP_DigestSign(ctx.get(), signature.data(), &sig_len, data.data(), data.size()) != 1) {
        throw opensslError("RS256 signing failed");
    }
    signature.resize(sig_len);
    return signature;
}

KeypairFiles writeRealmKeypair(const Keypair& keypair,
                               const std::string& realmName,
                               const std::filesystem::path& directory) {
    if (realmName.empty()) {
        throw std::invalid_argument("Realm name cannot be empty");
    }

    // Encode both halves before touching the filesystem
    std::string private_pem = keypair.privateKeyPem();
    std::string public_pem = keypair.publicKeyPem();

    KeypairFiles files{
        directory / (realmName + PRIVATE_KEY_SUFFIX),
        directory / (realmName + PUBLIC_KEY_SUFFIX)
    };

    writeFile(files.privateKey, private_pem);
    writeFile(files.publicKey, public_pem);

    return files;
}

KeypairFiles generateRealmKeypair(const std::string& realmName,
                                  const std::filesystem::path& directory) {
    if (realmName.empty()) {
        throw std::invalid_argument("Realm name cannot be empty");
    }
    auto keypair = Keypair::generate(RSA_KEY_BITS);
    return writeRealmKeypair(keypair, realmName, directory);
}

} // namespace realmauth
