// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe
// Probe Engine: fetch -> section modules in fixed order -> aggregated verdict

#ifndef SENTRY_PROBE_ENGINE_HPP
#define SENTRY_PROBE_ENGINE_HPP

#include <memory>
#include <string>
#include <vector>

#include "core/FieldAccessor.hpp"
#include "core/Report.hpp"
#include "core/Session.hpp"
#include "core/ValueStore.hpp"
#include "modules/SectionModule.hpp"
#include "telemetry/Metric.hpp"

namespace Sentry::Core {

    struct ProbeResult {
        Severity severity = Severity::UNKNOWN;
        std::string text;
        std::vector<Metric> metrics;
    };

    /**
     * @brief Egyetlen értékelési menet vezérlője.
     *
     * Sorrend: akku -> bemenet -> kimenet -> bypass -> riasztások -> önteszt.
     * A hibák (ConfigError, DataError) változatlanul továbbmennek a hívóhoz.
     */
    class ProbeEngine {
    private:
        Modules::EvaluationSettings settings;
        LogLevel currentLogLevel;
        std::vector<std::unique_ptr<Modules::ISectionModule>> modules;

    public:
        explicit ProbeEngine(Modules::EvaluationSettings evaluationSettings,
                             LogLevel level = LogLevel::SILENT);

        // Két fázisú lekérdezés a munkameneten, majd értékelés
        ProbeResult run(Session& session) const;

        ProbeResult evaluate(const ValueStore& store) const;

        static std::string deviceHead(const FieldAccessor& fields);
    };
}

#endif
