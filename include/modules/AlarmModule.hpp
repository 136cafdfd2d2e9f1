// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#ifndef SENTRY_ALARM_MODULE_HPP
#define SENTRY_ALARM_MODULE_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "modules/SectionModule.hpp"

namespace Sentry::Modules {

    struct AlarmEntry {
        std::string oid;     // upsAlarmDescr
        std::string name;    // ismert név vagy maga az OID
        uint64_t since = 0;  // upsAlarmTime (sysUpTime szerint)
        bool ignored = false;
    };

    /**
     * @brief upsAlarmTable feldolgozása.
     *
     * Az azonos időbélyegű, egymást követő riasztások közül csak a csoport
     * utolsó tagja kapja meg az eltelt időt: "a, b, c(5min)".
     */
    class AlarmModule : public ISectionModule {
    public:
        std::string getName() const override { return "AlarmModule"; }
        void run(EvaluationContext& ctx) override;

        static std::vector<AlarmEntry> collect(const EvaluationContext& ctx);
        static std::vector<std::string> displayNames(const std::vector<AlarmEntry>& active, uint64_t uptime);
    };
}

#endif
