#pragma once
#include "clock.hpp"
#include <stdexcept>
#include <string>

namespace modelgate {

enum class ErrorKind {
    CapabilityUnavailable,
    AllProvidersUnavailable,
    ConstraintsUnsatisfiable,
    ProviderTransientError,
    ProviderPermanentError,
    QueueRejected,
    RequestExpired,
    ConfigurationError
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CapabilityUnavailable: return "CapabilityUnavailable";
        case ErrorKind::AllProvidersUnavailable: return "AllProvidersUnavailable";
        case ErrorKind::ConstraintsUnsatisfiable: return "ConstraintsUnsatisfiable";
        case ErrorKind::ProviderTransientError: return "ProviderTransientError";
        case ErrorKind::ProviderPermanentError: return "ProviderPermanentError";
        case ErrorKind::QueueRejected: return "QueueRejected";
        case ErrorKind::RequestExpired: return "RequestExpired";
        case ErrorKind::ConfigurationError: return "ConfigurationError";
    }
    return "Unknown";
}

// Stable numeric codes reported to callers
inline int error_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CapabilityUnavailable: return 4101;
        case ErrorKind::AllProvidersUnavailable: return 4102;
        case ErrorKind::ConstraintsUnsatisfiable: return 4104;
        case ErrorKind::ProviderTransientError: return 4200;
        case ErrorKind::ProviderPermanentError: return 4201;
        case ErrorKind::QueueRejected: return 4400;
        case ErrorKind::RequestExpired: return 4500;
        case ErrorKind::ConfigurationError: return 4003;
    }
    return 4000;
}

// Everything infer() can surface to a caller.
class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorKind kind, const std::string& message, Duration retry_after = Duration{0})
        : std::runtime_error(message), kind_(kind), retry_after_(retry_after) {}

    ErrorKind kind() const { return kind_; }
    int code() const { return error_code(kind_); }

    // Only meaningful for AllProvidersUnavailable
    Duration retry_after() const { return retry_after_; }

private:
    ErrorKind kind_;
    Duration retry_after_;
};

enum class ProviderErrorKind { Transient, Permanent };

// Thrown by ProviderAdapter::invoke. Transient errors count against the
// provider's circuit and trigger failover; permanent ones do neither.
class ProviderError : public std::runtime_error {
public:
    ProviderError(ProviderErrorKind kind, const std::string& message, long http_status = 0)
        : std::runtime_error(message), kind_(kind), http_status_(http_status) {}

    ProviderErrorKind kind() const { return kind_; }
    bool transient() const { return kind_ == ProviderErrorKind::Transient; }
    long http_status() const { return http_status_; }

private:
    ProviderErrorKind kind_;
    long http_status_;
};

// Map an HTTP status from a provider to an error kind.
// 0 means the request never got a response (connect/timeout).
inline ProviderErrorKind classify_http_status(long status) {
    if (status == 0 || status == 408 || status == 409 || status == 425 || status == 429) {
        return ProviderErrorKind::Transient;
    }
    if (status >= 500) return ProviderErrorKind::Transient;
    return ProviderErrorKind::Permanent;
}

} // namespace modelgate
