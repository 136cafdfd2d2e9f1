// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#include "core/ProbeEngine.hpp"
#include "core/FetchPipeline.hpp"
#include "core/Threshold.hpp"
#include "modules/AlarmModule.hpp"
#include "modules/BatteryModule.hpp"
#include "modules/BypassModule.hpp"
#include "modules/InputModule.hpp"
#include "modules/OutputModule.hpp"
#include "modules/SelfTestModule.hpp"
#include "utils/UpsMibTemplates.hpp"
#include <iostream>
#include <utility>

namespace Sentry::Core {

    ProbeEngine::ProbeEngine(Modules::EvaluationSettings evaluationSettings, LogLevel level)
        : settings(std::move(evaluationSettings)), currentLogLevel(level) {
        modules.push_back(std::make_unique<Modules::BatteryModule>());
        modules.push_back(std::make_unique<Modules::InputModule>());
        modules.push_back(std::make_unique<Modules::OutputModule>());
        modules.push_back(std::make_unique<Modules::BypassModule>());
        modules.push_back(std::make_unique<Modules::AlarmModule>());
        modules.push_back(std::make_unique<Modules::SelfTestModule>());
    }

    ProbeResult ProbeEngine::run(Session& session) const {
        ValueStore store;
        FetchPipeline pipeline(session, store, SentryTemplates::MAX_OIDS_PER_REQUEST, currentLogLevel);
        FieldAccessor fields(store);

        pipeline.fetchInitial();
        pipeline.fetchTables(fields);

        if (currentLogLevel != LogLevel::SILENT) {
            std::cerr << "[ProbeEngine] " << store.size() << " values in "
                      << pipeline.requests() << " requests" << std::endl;
        }

        return evaluate(store);
    }

    ProbeResult ProbeEngine::evaluate(const ValueStore& store) const {
        FieldAccessor fields(store);

        // A küszöbök darabszáma a kimeneti vonalak számához kötött, ezt előre ellenőrizzük
        auto outputLines = static_cast<int64_t>(
            fields.unsignedValue(SentryTemplates::OUTPUT_NUM_LINES, "number of output lines"));
        validateThresholdCount(settings.loadThresholds.size(), outputLines);

        Report report;
        ProbeResult result;

        Modules::EvaluationContext ctx{
            fields,
            report,
            result.metrics,
            settings,
            fields.unsignedValue(SentryTemplates::SYS_UPTIME, "system uptime")
        };

        for (const auto& module : modules) {
            Severity before = report.level();
            module->run(ctx);

            if (currentLogLevel == LogLevel::DEBUG) {
                std::cerr << "[ProbeEngine] " << module->getName() << ": "
                          << severityName(before) << " -> " << severityName(report.level()) << std::endl;
            }
        }

        result.severity = report.level();
        result.text = report.render(deviceHead(fields));
        return result;
    }

    std::string ProbeEngine::deviceHead(const FieldAccessor& fields) {
        auto manufacturer = fields.optionalText(SentryTemplates::IDENT_MANUFACTURER);
        auto model = fields.optionalText(SentryTemplates::IDENT_MODEL);

        if (manufacturer && model) return *manufacturer + " " + *model;
        if (model) return *model;
        if (manufacturer) return *manufacturer;
        return SentryTemplates::UNIDENTIFIED_DEVICE;
    }

} // namespace Sentry::Core
