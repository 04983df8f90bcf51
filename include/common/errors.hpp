#pragma once

#include <stdexcept>
#include <string>

namespace updown {

/**
 * Failure talking to the discovery, pricing or time service.
 * status_code is the HTTP status, or 0 for transport and parse failures.
 */
class UpstreamError : public std::runtime_error {
public:
    UpstreamError(const std::string& what, long status_code = 0)
        : std::runtime_error(what)
        , status_code_(status_code)
    {
    }

    long status_code() const { return status_code_; }

private:
    long status_code_;
};

/**
 * Unknown asset or unsupported interval. Raised before any network call.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what)
    {
    }
};

} // namespace updown
