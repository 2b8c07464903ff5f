#ifndef LOADSIM_ERRORS_HPP
#define LOADSIM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace loadsim {

/**
 * @brief Invalid simulation configuration (trial count, percentile, options)
 *
 * Raised before any sampling takes place.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid input data (device list, utilisation profiles)
 *
 * Raised while loading or validating the model, before any sampling.
 * Values are never clamped into range.
 */
class DataError : public std::runtime_error {
public:
    explicit DataError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace loadsim

#endif // LOADSIM_ERRORS_HPP
