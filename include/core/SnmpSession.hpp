// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe - SnmpSession (net-snmp transport)

#ifndef SENTRY_SNMP_SESSION_HPP
#define SENTRY_SNMP_SESSION_HPP

#include <string>
#include <vector>

#include "core/Session.hpp"

namespace Sentry::Core {

    /**
     * @brief SNMP GET munkamenet a net-snmp "single session" API-jára építve.
     * v1, v2c és v3 (USM) támogatás. A nyitás hibája DataError.
     */
    class SnmpSession : public Session {
    private:
        void* handle;
        std::string peer;
        bool legacyV1;
        LogLevel currentLogLevel;

        std::string lastError() const;

    public:
        explicit SnmpSession(const SnmpSettings& settings, LogLevel level = LogLevel::SILENT);
        ~SnmpSession() override;

        SnmpSession(const SnmpSession&) = delete;
        SnmpSession& operator=(const SnmpSession&) = delete;

        ValueMap fetch(const std::vector<std::string>& oids) override;

        void setLogLevel(LogLevel level) { currentLogLevel = level; }
    };
}

#endif
