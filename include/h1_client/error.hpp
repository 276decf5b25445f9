#pragma once
#include <string>

namespace h1_client {
    /**
     * @brief Terminal error reported by the transport.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidUrl,       /**< The URL could not be parsed. */
            InvalidScheme,    /**< Scheme is not http, or https without TLS. */
            MissingHost,      /**< The URL has no host. */
            ResolutionError,  /**< The host resolved to no address. */
            ConnectError,     /**< Dialing the remote address failed. */
            TlsError,         /**< The TLS handshake failed. */
            NoUsableAddress,  /**< Every resolved address failed to connect. */
            ProtocolError,    /**< The HTTP exchange failed after connect. */
            Timeout,          /**< Waiting for a pooled connection timed out. */
            PoolShutdown,     /**< The pool was shut down while waiting. */
            InvalidConfiguration, /**< The configuration can never work. */
            Unknown,          /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    /// @brief Stable name of an error code, for log lines and diagnostics.
    inline const char* to_string(Error::Code code) noexcept {
        switch (code) {
            case Error::Code::InvalidUrl:
                return "InvalidUrl";
            case Error::Code::InvalidScheme:
                return "InvalidScheme";
            case Error::Code::MissingHost:
                return "MissingHost";
            case Error::Code::ResolutionError:
                return "ResolutionError";
            case Error::Code::ConnectError:
                return "ConnectError";
            case Error::Code::TlsError:
                return "TlsError";
            case Error::Code::NoUsableAddress:
                return "NoUsableAddress";
            case Error::Code::ProtocolError:
                return "ProtocolError";
            case Error::Code::Timeout:
                return "Timeout";
            case Error::Code::PoolShutdown:
                return "PoolShutdown";
            case Error::Code::InvalidConfiguration:
                return "InvalidConfiguration";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }
}  // namespace h1_client
