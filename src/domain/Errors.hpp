#pragma once

#include <stdexcept>
#include <string>

namespace mdc::domain {

// Base for every failure that originates at the price-history provider.
class UpstreamError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// DNS, connect, TLS, read/write failures and timeouts.
class UpstreamUnreachable : public UpstreamError {
public:
    using UpstreamError::UpstreamError;
};

class UpstreamHttpError : public UpstreamError {
public:
    UpstreamHttpError(unsigned status, const std::string& message)
        : UpstreamError(message), status_(status) {}

    unsigned status() const noexcept { return status_; }

private:
    unsigned status_;
};

class UpstreamMalformedResponse : public UpstreamError {
public:
    using UpstreamError::UpstreamError;
};

// Raised by boundary parsing only; the chart core never throws it.
class InvalidTimeframe : public std::invalid_argument {
public:
    explicit InvalidTimeframe(const std::string& value)
        : std::invalid_argument("Unsupported timeframe: " + value), value_(value) {}

    const std::string& value() const noexcept { return value_; }

private:
    std::string value_;
};

}  // namespace mdc::domain
