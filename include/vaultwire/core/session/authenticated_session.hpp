/**
 * @file authenticated_session.hpp
 * @brief Login state machine and vault operations on top of ProtocolClient.
 *
 * Login is an RSA challenge-response: the server encrypts a random number
 * with the user's registered public key, the client decrypts it and sends it
 * back. A correct answer turns the pending session token into an active one.
 */
#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "vaultwire/core/client/protocol_client.hpp"
#include "vaultwire/core/config/client_config.hpp"
#include "vaultwire/core/crypto/rsa_keypair.hpp"
#include "vaultwire/core/protocol/message.hpp"

namespace vaultwire {

    /**
     * @enum SessionState
     * @brief Login progress of an AuthenticatedSession.
     */
    enum class SessionState { Anonymous, AwaitingChallenge, Authenticated };

    const char* toString(SessionState s) noexcept;

    /**
     * @class AuthenticatedSession
     * @brief Holds the user's key pair and session token and issues vault requests.
     *
     * All public operations are serialized by an internal mutex. Every request
     * returns the server's literal response; a non-"Success" reply is a
     * result, not an error.
     */
    class AuthenticatedSession {
    public:
        /**
         * @brief Create a session for the configured server.
         *
         * Creates the key-storage directory if it does not exist.
         * @throws ConfigError if the key-storage directory cannot be created
         */
        explicit AuthenticatedSession(ClientConfig config);

        AuthenticatedSession(const AuthenticatedSession&) = delete;
        AuthenticatedSession& operator=(const AuthenticatedSession&) = delete;

        /// Access to the underlying client (transport factory, certificate policy).
        ProtocolClient& client() noexcept { return client_; }

        /**
         * @brief Load keys from DER PKCS#1 files.
         * @throws CryptoError if neither file exists or a file is unreadable
         */
        void importKeys(const std::filesystem::path& publicKeyFile,
                        const std::filesystem::path& privateKeyFile);

        /**
         * @brief Generate a new 2048-bit key pair and store it in the key-storage directory.
         * @return Paths of the written public and private key files
         * @throws CryptoError if generation or writing fails
         */
        std::pair<std::filesystem::path, std::filesystem::path>
        createNewKeys(const std::string& publicKeyFileName, const std::string& privateKeyFileName);

        /**
         * @brief Register @p username with the current public key.
         *
         * Generates an in-memory key pair first if none is loaded.
         */
        Message createUser(const std::string& username);

        /**
         * @brief Ask the server for a login challenge.
         *
         * An empty response body (unknown user) returns the state to Anonymous.
         */
        Message loginRequest(const std::string& username);

        /**
         * @brief Answer a login challenge.
         * @param challenge Encrypted number from the login_request response
         * @param session Session token from the login_request response
         * @throws CryptoError if the challenge cannot be decrypted (state becomes Anonymous)
         */
        Message loginTest(const std::vector<uint8_t>& challenge, const std::string& session);

        /**
         * @brief Run loginRequest and, if a challenge was issued, loginTest.
         * @return The login_test response, or the login_request response if no challenge was issued
         */
        Message login(const std::string& username);

        /// @throws SessionStateError unless Authenticated
        Message getSources();
        Message getSources(const std::string& session);

        /// @throws SessionStateError unless Authenticated
        Message getPassword(const std::string& source);
        Message getPassword(const std::string& source, const std::string& session);

        /**
         * @brief Store @p password for @p source, RSA-encrypted with the current public key.
         * @throws SessionStateError unless Authenticated
         * @throws CryptoError if the password is too long for the key
         */
        Message setPassword(const std::string& source, const std::string& password);
        Message setPassword(const std::string& source, const std::string& password, const std::string& session);

        /// @throws SessionStateError unless Authenticated
        Message deletePassword(const std::string& source);
        Message deletePassword(const std::string& source, const std::string& session);

        /**
         * @brief Delete the account. A "Success" reply returns the state to Anonymous.
         * @throws SessionStateError unless Authenticated
         */
        Message deleteUser();
        Message deleteUser(const std::string& session);

        /**
         * @brief Decrypt a password returned by get_password.
         * @throws CryptoError if no private key is loaded or decryption fails
         */
        std::string decryptPassword(const std::vector<uint8_t>& ciphertext) const;

        /**
         * @brief Parse the JSON array body of a get_sources response.
         * @throws ProtocolError if the body is not a JSON array of strings
         */
        static std::vector<std::string> parseSources(const std::string& body);

        SessionState state() const;
        std::optional<std::string> sessionToken() const;
        bool hasKeys() const;

        /// Base64 of the DER public key, generating a key pair if none is loaded.
        std::string publicKeyBase64();

        /// Forget the session token locally. No request is sent.
        void logout();

    private:
        const RsaKeyPair& keysLocked();
        /// Active token; throws SessionStateError unless Authenticated.
        std::string requireAuthenticated(const char* operation) const;
        Message loginTestLocked(const std::vector<uint8_t>& challenge, const std::string& session);
        Message loginRequestLocked(const std::string& username);

        mutable std::mutex         mtx_;
        ProtocolClient             client_;
        std::optional<RsaKeyPair>  keys_;
        SessionState               state_ = SessionState::Anonymous;
        std::optional<std::string> pending_;
        std::optional<std::string> token_;
    };

}
