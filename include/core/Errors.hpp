// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#ifndef SENTRY_ERRORS_HPP
#define SENTRY_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Sentry::Core {

    /**
     * @brief Hibás parancssor vagy küszöb-konfiguráció. A futás UNKNOWN állapottal áll le.
     */
    class ConfigError : public std::runtime_error {
    public:
        explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
    };

    /**
     * @brief Adathiba: sikertelen SNMP kérés, hiányzó vagy hibás kötelező mező.
     */
    class DataError : public std::runtime_error {
    public:
        explicit DataError(const std::string& what) : std::runtime_error(what) {}
    };
}

#endif
