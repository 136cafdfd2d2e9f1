// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#ifndef SENTRY_SECTION_MODULE_HPP
#define SENTRY_SECTION_MODULE_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "core/AlarmFilter.hpp"
#include "core/FieldAccessor.hpp"
#include "core/Report.hpp"
#include "core/Threshold.hpp"
#include "telemetry/Metric.hpp"

namespace Sentry::Modules {

    /**
     * @brief A felhasználói beállítások, amelyek az értékelést befolyásolják.
     */
    struct EvaluationSettings {
        Sentry::Core::AlarmFilter ignoredAlarms;
        bool suppressTestResults = false;
        std::vector<Sentry::Core::ThresholdSpec> loadThresholds;
    };

    /**
     * @brief Egy értékelési menet közös állapota.
     * A Report és a metrika-lista az egyetlen írható rész; a sorrend rögzített.
     */
    struct EvaluationContext {
        const Sentry::Core::FieldAccessor& fields;
        Sentry::Core::Report& report;
        std::vector<Sentry::Core::Metric>& metrics;
        const EvaluationSettings& settings;

        // sysUpTime (1/100 s), az eltelt idők viszonyítási pontja
        uint64_t uptime = 0;
    };

    class ISectionModule {
    public:
        virtual ~ISectionModule() = default;

        virtual std::string getName() const = 0;
        virtual void run(EvaluationContext& ctx) = 0;
    };
}

#endif
