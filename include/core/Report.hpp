// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe
// Severity aggregation: three fragment buckets + a monotonic running level

#ifndef SENTRY_REPORT_HPP
#define SENTRY_REPORT_HPP

#include <string>
#include <vector>

namespace Sentry::Core {

    /**
     * @brief Állapotszintek; az értékek egyben a plugin kilépési kódjai.
     * UNKNOWN csak végzetes hibánál fordul elő.
     */
    enum class Severity {
        OK = 0,
        WARNING = 1,
        CRITICAL = 2,
        UNKNOWN = 3
    };

    const char* severityName(Severity severity);

    /**
     * @brief A szekció-értékelők közös gyűjtője.
     *
     * A futó szint soha nem csökken. Ha már CRITICAL, az új WARNING
     * töredékek eldobódnak; CRITICAL töredék mindig bekerül.
     */
    class Report {
    private:
        Severity current{Severity::OK};

        std::vector<std::string> okFragments;
        std::vector<std::string> warningFragments;
        std::vector<std::string> criticalFragments;

    public:
        void add(Severity severity, const std::string& fragment);

        void ok(const std::string& fragment) { add(Severity::OK, fragment); }
        void warning(const std::string& fragment) { add(Severity::WARNING, fragment); }
        void critical(const std::string& fragment) { add(Severity::CRITICAL, fragment); }

        [[nodiscard]] Severity level() const { return current; }
        [[nodiscard]] const std::vector<std::string>& fragments(Severity severity) const;

        /**
         * @brief A végső szöveg összeállítása.
         *
         * OK:       "<head>: <ok, ...>"
         * WARNING:  "<warning, ...>[, OK: <ok, ...>]"
         * CRITICAL: "<critical, ...>[, WARNING: <warning, ...>][, OK: <ok, ...>]"
         */
        [[nodiscard]] std::string render(const std::string& head) const;
    };
}

#endif
