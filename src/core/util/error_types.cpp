#include "vaultwire/core/util/error_types.hpp"
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

namespace vaultwire {

    const char* toString(ClientErr code) noexcept {
        switch (code) {
            case ClientErr::ConnectionRefused:   return "ConnectionRefused";
            case ClientErr::ConnectionTimedOut:  return "ConnectionTimedOut";
            case ClientErr::UnknownTransport:    return "UnknownTransportError";
            case ClientErr::CertificateRejected: return "CertificateRejected";
            case ClientErr::Framing:             return "FramingError";
            case ClientErr::Crypto:              return "CryptoError";
            case ClientErr::SessionState:        return "SessionStateError";
            case ClientErr::Protocol:            return "ProtocolError";
            case ClientErr::Config:              return "ConfigError";
        }
        return "Unknown";
    }

    ClientErr classifyTransportError(const boost::system::error_code& ec) noexcept {
        namespace error = boost::asio::error;
        if (ec == error::connection_refused)
            return ClientErr::ConnectionRefused;
        if (ec == error::timed_out)
            return ClientErr::ConnectionTimedOut;
        return ClientErr::UnknownTransport;
    }

    TransportError makeTransportError(const std::string& what, const boost::system::error_code& ec) {
        const ClientErr reason = classifyTransportError(ec);
        return TransportError(reason, what + " failed (" + toString(reason) + "): " + ec.message());
    }

}
