#include "vaultwire/core/crypto/rsa_keypair.hpp"
#include "vaultwire/core/util/error_types.hpp"
#include "vaultwire/core/util/logger.hpp"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <fstream>
#include <iterator>
#include <limits>

namespace vaultwire {

    namespace {
        using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
        using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;

        // PKCS#1 v1.5 encryption padding overhead
        constexpr int kPkcs1Overhead = 11;

        /// Drain the OpenSSL error queue into a readable message.
        std::string opensslError(const std::string& what) {
            std::string msg = what;
            unsigned long e;
            while ((e = ERR_get_error()) != 0) {
                char buf[256];
                ERR_error_string_n(e, buf, sizeof(buf));
                msg += ": ";
                msg += buf;
            }
            return msg;
        }

        std::vector<uint8_t> readFile(const std::filesystem::path& p) {
            std::ifstream in(p, std::ios::binary);
            if (!in)
                throw CryptoError("cannot open key file " + p.string());
            return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }

        void writeFile(const std::filesystem::path& p, const std::vector<uint8_t>& data) {
            std::ofstream out(p, std::ios::binary | std::ios::trunc);
            if (!out)
                throw CryptoError("cannot create key file " + p.string());
            out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            if (!out)
                throw CryptoError("cannot write key file " + p.string());
        }

        long checkedLength(const std::vector<uint8_t>& der) {
            if (der.empty())
                throw CryptoError("empty key data");
            if (der.size() > static_cast<size_t>(std::numeric_limits<long>::max()))
                throw CryptoError("key data too large");
            return static_cast<long>(der.size());
        }
    }

    struct RsaKeyPair::Impl {
        PkeyPtr key{ nullptr, &EVP_PKEY_free };
        bool    hasPrivate = false;
    };

    RsaKeyPair::RsaKeyPair(std::unique_ptr<Impl> impl) : pImpl_(std::move(impl)) {}
    RsaKeyPair::RsaKeyPair(RsaKeyPair&&) noexcept = default;
    RsaKeyPair& RsaKeyPair::operator=(RsaKeyPair&&) noexcept = default;
    RsaKeyPair::~RsaKeyPair() = default;

    RsaKeyPair RsaKeyPair::generate(int bits) {
        PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), &EVP_PKEY_CTX_free);
        if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
            EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0)
            throw CryptoError(opensslError("RSA key generation setup failed"));

        EVP_PKEY* raw = nullptr;
        if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0)
            throw CryptoError(opensslError("RSA key generation failed"));

        auto impl = std::make_unique<Impl>();
        impl->key.reset(raw);
        impl->hasPrivate = true;
        LOG_DEBUG("[RsaKeyPair] generated " + std::to_string(bits) + "-bit key pair");
        return RsaKeyPair(std::move(impl));
    }

    RsaKeyPair RsaKeyPair::fromPrivateDer(const std::vector<uint8_t>& der) {
        const long len = checkedLength(der);
        const unsigned char* p = der.data();
        EVP_PKEY* raw = d2i_PrivateKey(EVP_PKEY_RSA, nullptr, &p, len);
        if (!raw)
            throw CryptoError(opensslError("invalid RSA private key"));

        auto impl = std::make_unique<Impl>();
        impl->key.reset(raw);
        impl->hasPrivate = true;
        return RsaKeyPair(std::move(impl));
    }

    RsaKeyPair RsaKeyPair::fromPublicDer(const std::vector<uint8_t>& der) {
        const long len = checkedLength(der);
        const unsigned char* p = der.data();
        EVP_PKEY* raw = d2i_PublicKey(EVP_PKEY_RSA, nullptr, &p, len);
        if (!raw)
            throw CryptoError(opensslError("invalid RSA public key"));

        auto impl = std::make_unique<Impl>();
        impl->key.reset(raw);
        impl->hasPrivate = false;
        return RsaKeyPair(std::move(impl));
    }

    RsaKeyPair RsaKeyPair::loadFiles(const std::filesystem::path& publicKeyFile,
                                     const std::filesystem::path& privateKeyFile) {
        const bool havePublic = !publicKeyFile.empty() && std::filesystem::exists(publicKeyFile);
        const bool havePrivate = !privateKeyFile.empty() && std::filesystem::exists(privateKeyFile);

        if (havePrivate) {
            RsaKeyPair pair = fromPrivateDer(readFile(privateKeyFile));
            if (havePublic && fromPublicDer(readFile(publicKeyFile)).publicKeyDer() != pair.publicKeyDer())
                throw CryptoError("public key file " + publicKeyFile.string() +
                                  " does not belong to private key file " + privateKeyFile.string());
            return pair;
        }
        if (havePublic) {
            LOG_WARN("[RsaKeyPair] no private key file, loaded encrypt-only key from " + publicKeyFile.string());
            return fromPublicDer(readFile(publicKeyFile));
        }
        throw CryptoError("neither " + publicKeyFile.string() + " nor " + privateKeyFile.string() + " exists");
    }

    bool RsaKeyPair::hasPrivateKey() const noexcept {
        return pImpl_ && pImpl_->hasPrivate;
    }

    int RsaKeyPair::bits() const noexcept {
        return pImpl_ ? EVP_PKEY_bits(pImpl_->key.get()) : 0;
    }

    std::vector<uint8_t> RsaKeyPair::publicKeyDer() const {
        const int len = i2d_PublicKey(pImpl_->key.get(), nullptr);
        if (len <= 0)
            throw CryptoError(opensslError("RSA public key export failed"));
        std::vector<uint8_t> out(static_cast<size_t>(len));
        unsigned char* p = out.data();
        if (i2d_PublicKey(pImpl_->key.get(), &p) != len)
            throw CryptoError(opensslError("RSA public key export failed"));
        return out;
    }

    std::vector<uint8_t> RsaKeyPair::privateKeyDer() const {
        if (!hasPrivateKey())
            throw CryptoError("no private key loaded");
        const int len = i2d_PrivateKey(pImpl_->key.get(), nullptr);
        if (len <= 0)
            throw CryptoError(opensslError("RSA private key export failed"));
        std::vector<uint8_t> out(static_cast<size_t>(len));
        unsigned char* p = out.data();
        if (i2d_PrivateKey(pImpl_->key.get(), &p) != len)
            throw CryptoError(opensslError("RSA private key export failed"));
        return out;
    }

    void RsaKeyPair::saveFiles(const std::filesystem::path& publicKeyFile,
                               const std::filesystem::path& privateKeyFile) const {
        const auto priv = privateKeyDer();
        writeFile(publicKeyFile, publicKeyDer());
        writeFile(privateKeyFile, priv);

        std::error_code ec;
        std::filesystem::permissions(privateKeyFile,
                                     std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace, ec);
        if (ec)
            LOG_WARN("[RsaKeyPair] could not restrict permissions of " + privateKeyFile.string() + ": " + ec.message());
    }

    std::vector<uint8_t> RsaKeyPair::encrypt(const std::vector<uint8_t>& plaintext) const {
        const int maxLen = EVP_PKEY_size(pImpl_->key.get()) - kPkcs1Overhead;
        if (plaintext.size() > static_cast<size_t>(maxLen))
            throw CryptoError("plaintext of " + std::to_string(plaintext.size()) +
                              " bytes exceeds the " + std::to_string(maxLen) + "-byte RSA limit");

        PkeyCtxPtr ctx(EVP_PKEY_CTX_new(pImpl_->key.get(), nullptr), &EVP_PKEY_CTX_free);
        if (!ctx || EVP_PKEY_encrypt_init(ctx.get()) <= 0 ||
            EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) <= 0)
            throw CryptoError(opensslError("RSA encryption setup failed"));

        size_t outLen = 0;
        if (EVP_PKEY_encrypt(ctx.get(), nullptr, &outLen, plaintext.data(), plaintext.size()) <= 0)
            throw CryptoError(opensslError("RSA encryption failed"));
        std::vector<uint8_t> out(outLen);
        if (EVP_PKEY_encrypt(ctx.get(), out.data(), &outLen, plaintext.data(), plaintext.size()) <= 0)
            throw CryptoError(opensslError("RSA encryption failed"));
        out.resize(outLen);
        return out;
    }

    std::vector<uint8_t> RsaKeyPair::decrypt(const std::vector<uint8_t>& ciphertext) const {
        if (!hasPrivateKey())
            throw CryptoError("cannot decrypt without a private key");
        if (ciphertext.empty())
            throw CryptoError("empty ciphertext");

        PkeyCtxPtr ctx(EVP_PKEY_CTX_new(pImpl_->key.get(), nullptr), &EVP_PKEY_CTX_free);
        if (!ctx || EVP_PKEY_decrypt_init(ctx.get()) <= 0 ||
            EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) <= 0)
            throw CryptoError(opensslError("RSA decryption setup failed"));

        size_t outLen = 0;
        if (EVP_PKEY_decrypt(ctx.get(), nullptr, &outLen, ciphertext.data(), ciphertext.size()) <= 0)
            throw CryptoError(opensslError("RSA decryption failed"));
        std::vector<uint8_t> out(outLen);
        if (EVP_PKEY_decrypt(ctx.get(), out.data(), &outLen, ciphertext.data(), ciphertext.size()) <= 0)
            throw CryptoError(opensslError("RSA decryption failed"));
        out.resize(outLen);
        return out;
    }

}
