/**
 * @file error_types.hpp
 * @brief Error type definitions for VaultWire.
 *
 * Provides the error code enum and the exception hierarchy raised by the
 * transport, framing, crypto and session layers. Callers render these as
 * user-facing messages; the core only classifies.
 */
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace boost::system { class error_code; }

namespace vaultwire {

    /**
     * @enum ClientErr
     * @brief Error codes for client operations.
     *
     * - ConnectionRefused: remote endpoint is not accepting connections
     * - ConnectionTimedOut: no response within the configured timeout
     * - UnknownTransport: any other transport-level fault
     * - CertificateRejected: TLS peer identity failed verification
     * - Framing: received bytes violate the wire format
     * - Crypto: key import/export, encryption or decryption failure
     * - SessionState: operation not allowed in the current login state
     * - Protocol: a response body could not be interpreted
     * - Config: invalid client configuration
     */
    enum class ClientErr : int {
        ConnectionRefused = 1,  ///< Endpoint refused the connection
        ConnectionTimedOut,     ///< Connect or read deadline elapsed
        UnknownTransport,       ///< Any other transport fault
        CertificateRejected,    ///< TLS identity verification failed
        Framing,                ///< Malformed or truncated frame
        Crypto,                 ///< RSA / key material failure
        SessionState,           ///< Operation requires another login state
        Protocol,               ///< Uninterpretable response body
        Config = 99             ///< Invalid configuration
    };

    /**
     * @brief Human readable name of an error code.
     */
    const char* toString(ClientErr code) noexcept;

    /**
     * @class ClientError
     * @brief Base class of every error raised by VaultWire.
     */
    class ClientError : public std::runtime_error {
    public:
        ClientError(ClientErr code, const std::string& msg)
            : std::runtime_error(msg), code_(code) {}

        /**
         * @brief Classified error code.
         */
        ClientErr code() const noexcept { return code_; }

    private:
        ClientErr code_;
    };

    /**
     * @class TransportError
     * @brief Connection level fault (refused, timed out, rejected certificate, other).
     */
    class TransportError : public ClientError {
    public:
        TransportError(ClientErr reason, const std::string& msg)
            : ClientError(reason, msg) {}
    };

    /**
     * @class FramingError
     * @brief A frame violates the wire format (bad tag, truncated read, missing Content-Length).
     */
    class FramingError : public ClientError {
    public:
        explicit FramingError(const std::string& msg)
            : ClientError(ClientErr::Framing, msg) {}
    };

    /**
     * @class CryptoError
     * @brief Key import/export or RSA encryption/decryption failure.
     */
    class CryptoError : public ClientError {
    public:
        explicit CryptoError(const std::string& msg)
            : ClientError(ClientErr::Crypto, msg) {}
    };

    /**
     * @class SessionStateError
     * @brief A vault operation was issued without an authenticated session.
     */
    class SessionStateError : public ClientError {
    public:
        explicit SessionStateError(const std::string& msg)
            : ClientError(ClientErr::SessionState, msg) {}
    };

    /**
     * @class ProtocolError
     * @brief A well-formed response carries a body the client cannot interpret.
     */
    class ProtocolError : public ClientError {
    public:
        explicit ProtocolError(const std::string& msg)
            : ClientError(ClientErr::Protocol, msg) {}
    };

    /**
     * @class ConfigError
     * @brief Missing or invalid configuration value.
     */
    class ConfigError : public ClientError {
    public:
        explicit ConfigError(const std::string& msg)
            : ClientError(ClientErr::Config, msg) {}
    };

    /**
     * @brief Map a networking error code to a transport error reason.
     *
     * Uses the portable error conditions exposed by Boost.System, never raw
     * platform error numbers:
     *   - connection_refused → ConnectionRefused
     *   - timed_out          → ConnectionTimedOut
     *   - anything else      → UnknownTransport
     * @param ec Error reported by the networking layer
     * @return Classified reason
     */
    ClientErr classifyTransportError(const boost::system::error_code& ec) noexcept;

    /**
     * @brief Build a classified TransportError from a networking error code.
     * @param what Operation that failed ("connect", "read", ...)
     * @param ec Error reported by the networking layer
     */
    TransportError makeTransportError(const std::string& what, const boost::system::error_code& ec);

}
