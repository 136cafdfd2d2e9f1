// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#ifndef SENTRY_ALARM_FILTER_HPP
#define SENTRY_ALARM_FILTER_HPP

#include <set>
#include <string>

namespace Sentry::Core {

    /**
     * @brief A felhasználó által figyelmen kívül hagyott riasztások halmaza.
     *
     * Elfogadott formák: ismert név ("OnBattery", kis/nagybetű mindegy),
     * szám az upsWellKnownAlarms névtérből (1..24), vagy teljes pontozott OID.
     * Mindhárom ugyanarra az OID-ra képződik le.
     */
    class AlarmFilter {
    private:
        std::set<std::string> oids;

    public:
        // ConfigError, ha a token egyik formának sem felel meg
        void add(const std::string& token);
        void addList(const std::string& csv);

        [[nodiscard]] bool matches(const std::string& oid, const std::string& name) const;
        [[nodiscard]] bool empty() const { return oids.empty(); }
        [[nodiscard]] const std::set<std::string>& identifiers() const { return oids; }
    };
}

#endif
