// File: common/errors.hpp

#ifndef COMMON_ERRORS_HPP
#define COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace common {

    // Fatal for the whole run: bad capture root, nothing to compare, unusable configuration.
    class ConfigurationError : public std::runtime_error {
    public:
        explicit ConfigurationError(const std::string &message) : std::runtime_error(message) {}
    };

    // Scoped to a single screenshot pair; the pair is skipped and the run continues.
    class DecodeError : public std::runtime_error {
    public:
        explicit DecodeError(const std::string &message) : std::runtime_error(message) {}
    };

} // namespace common

#endif // COMMON_ERRORS_HPP
