/**
 * @file rsa_keypair.hpp
 * @brief RSA key material used for the login challenge and password encryption.
 *
 * Keys are exchanged and stored as DER-encoded PKCS#1 structures
 * (RSAPublicKey / RSAPrivateKey). Encryption uses PKCS#1 v1.5 padding, which
 * is what the vault server expects; OAEP is not used.
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace vaultwire {

    /**
     * @class RsaKeyPair
     * @brief Owns one RSA key (public-only or full pair).
     *
     * Movable, not copyable. Instances are not internally synchronized;
     * AuthenticatedSession serializes access.
     */
    class RsaKeyPair {
    public:
        static constexpr int kDefaultBits = 2048;

        /**
         * @brief Generate a new key pair.
         * @throws CryptoError if key generation fails
         */
        static RsaKeyPair generate(int bits = kDefaultBits);

        /**
         * @brief Import a full key pair from DER PKCS#1 RSAPrivateKey bytes.
         * @throws CryptoError if the bytes are not a valid RSA private key
         */
        static RsaKeyPair fromPrivateDer(const std::vector<uint8_t>& der);

        /**
         * @brief Import an encrypt-only key from DER PKCS#1 RSAPublicKey bytes.
         * @throws CryptoError if the bytes are not a valid RSA public key
         */
        static RsaKeyPair fromPublicDer(const std::vector<uint8_t>& der);

        /**
         * @brief Load keys from files.
         *
         * The private key file, when it exists, provides the full pair and
         * the public key file is only checked for consistency. Otherwise the
         * public key file provides an encrypt-only key.
         * @throws CryptoError if neither file exists, a file cannot be read or parsed,
         *         or the two files hold different keys
         */
        static RsaKeyPair loadFiles(const std::filesystem::path& publicKeyFile,
                                    const std::filesystem::path& privateKeyFile);

        RsaKeyPair(RsaKeyPair&&) noexcept;
        RsaKeyPair& operator=(RsaKeyPair&&) noexcept;
        RsaKeyPair(const RsaKeyPair&) = delete;
        RsaKeyPair& operator=(const RsaKeyPair&) = delete;
        ~RsaKeyPair();

        /// True if the private half is available.
        bool hasPrivateKey() const noexcept;

        /// Modulus size in bits.
        int bits() const noexcept;

        /// DER PKCS#1 RSAPublicKey.
        std::vector<uint8_t> publicKeyDer() const;

        /**
         * @brief DER PKCS#1 RSAPrivateKey.
         * @throws CryptoError if the key is public-only
         */
        std::vector<uint8_t> privateKeyDer() const;

        /**
         * @brief Write both halves to files (private file created with owner-only permissions).
         * @throws CryptoError if the key is public-only or a file cannot be written
         */
        void saveFiles(const std::filesystem::path& publicKeyFile,
                       const std::filesystem::path& privateKeyFile) const;

        /**
         * @brief RSA encrypt with PKCS#1 v1.5 padding.
         * @throws CryptoError if the plaintext is too long for the key or encryption fails
         */
        std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext) const;

        /**
         * @brief RSA decrypt with PKCS#1 v1.5 padding.
         * @throws CryptoError if the key is public-only or the ciphertext does not match the key
         */
        std::vector<uint8_t> decrypt(const std::vector<uint8_t>& ciphertext) const;

    private:
        struct Impl;
        explicit RsaKeyPair(std::unique_ptr<Impl> impl);
        std::unique_ptr<Impl> pImpl_;
    };

}
