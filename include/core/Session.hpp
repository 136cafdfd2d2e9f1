// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#ifndef SENTRY_SESSION_HPP
#define SENTRY_SESSION_HPP

#include <string>
#include <vector>

#include "core/ValueStore.hpp"

namespace Sentry::Core {

    /**
     * @brief Log-szintek a diagnosztikai kimenethez (stderr).
     * A stdout kizárólag a plugin sorát kapja.
     */
    enum class LogLevel { SILENT, INFO, DEBUG };

    inline LogLevel logLevelFromVerbosity(int verbosity) {
        if (verbosity >= 2) return LogLevel::DEBUG;
        if (verbosity == 1) return LogLevel::INFO;
        return LogLevel::SILENT;
    }

    enum class SnmpVersion { V1, V2C, V3 };

    struct SnmpSettings {
        std::string hostname;
        unsigned port = 161;
        SnmpVersion version = SnmpVersion::V2C;
        std::string community = "public";

        // SNMPv3 (USM)
        std::string username;
        std::string authProtocol = "MD5";
        std::string authPassword;
        std::string privProtocol = "DES";
        std::string privPassword;

        unsigned timeoutSeconds = 15;
        int retries = 1;
    };

    /**
     * @brief A szállítási réteg szerződése.
     *
     * fetch(): OID lista -> OID/érték párok. A hiányzó (noSuch*) OID-ok
     * egyszerűen kimaradnak a válaszból. Sikertelen kérés DataError.
     */
    class Session {
    public:
        virtual ~Session() = default;
        virtual ValueMap fetch(const std::vector<std::string>& oids) = 0;
    };
}

#endif
