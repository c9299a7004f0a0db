/**
 * @file Errors.hpp
 * @brief Exception types raised by the discovery and lifecycle engine.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace lanwatch::core {

/**
 * @brief Invalid scan configuration, interval, preset, subnet or date.
 *
 * Raised before any probing happens and never retried.
 */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A probe backend could not complete (tool missing, non-zero exit, timeout).
 */
class ProbeBackendError : public std::runtime_error {
public:
    ProbeBackendError(const std::string& backend, const std::string& message)
        : std::runtime_error(backend + ": " + message), backend_(backend) {}

    [[nodiscard]] const std::string& backend() const { return backend_; }

private:
    std::string backend_;
};

/**
 * @brief A device or other record referenced by id or hardware address does not exist.
 */
class NotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace lanwatch::core
