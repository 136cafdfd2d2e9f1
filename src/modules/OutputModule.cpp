// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#include "modules/OutputModule.hpp"
#include "utils/UpsMibTemplates.hpp"
#include <algorithm>

namespace Sentry::Modules {

    using namespace SentryTemplates;
    using Sentry::Core::Severity;
    using Sentry::Core::makeBoundedMetric;
    using Sentry::Core::makeMetric;
    using Sentry::Core::thresholdForLine;

    void OutputModule::run(EvaluationContext& ctx) {
        const auto& f = ctx.fields;
        const auto& thresholds = ctx.settings.loadThresholds;

        double frequency = static_cast<double>(f.unsignedValue(OUTPUT_FREQUENCY, "output frequency")) * 0.1;
        int64_t source = f.code(OUTPUT_SOURCE, 1, static_cast<int64_t>(OUTPUT_SOURCE_NAMES.size()), "output source");
        auto lines = static_cast<int64_t>(f.unsignedValue(OUTPUT_NUM_LINES, "number of output lines"));

        ctx.metrics.push_back(makeMetric("output_frequency", frequency, "Hz"));

        uint64_t maxLoad = 0;
        for (int64_t line = 1; line <= lines; ++line) {
            const std::string n = std::to_string(line);
            const std::string prefix = "output" + n + "_";

            double voltage = static_cast<double>(
                f.unsignedValue(tableCell(OUTPUT_ENTRY, OUTPUT_COL_VOLTAGE, line), "output " + n + " voltage")) * 0.1;
            double current = static_cast<double>(
                f.unsignedValue(tableCell(OUTPUT_ENTRY, OUTPUT_COL_CURRENT, line), "output " + n + " current")) * 0.1;
            uint64_t power = f.unsignedValue(tableCell(OUTPUT_ENTRY, OUTPUT_COL_POWER, line), "output " + n + " power");
            uint64_t load = f.unsignedValue(tableCell(OUTPUT_ENTRY, OUTPUT_COL_LOAD, line), "output " + n + " load");

            maxLoad = std::max(maxLoad, load);

            ctx.metrics.push_back(makeMetric(prefix + "voltage", voltage, "V"));
            ctx.metrics.push_back(makeMetric(prefix + "current", current, "A"));
            ctx.metrics.push_back(makeMetric(prefix + "power", static_cast<double>(power), "W"));

            auto loadMetric = makeBoundedMetric(prefix + "load", static_cast<double>(load), "%", 0, 100);

            if (!thresholds.empty()) {
                const auto& spec = thresholdForLine(thresholds, line);
                loadMetric.warning = spec.warningText();
                loadMetric.critical = spec.criticalText();

                std::string fragment = "output line " + n + " load " + std::to_string(load) + "%";
                switch (spec.classify(static_cast<double>(load))) {
                    case Severity::CRITICAL:
                        ctx.report.critical(fragment);
                        break;
                    case Severity::WARNING:
                        ctx.report.warning(fragment);
                        break;
                    default:
                        break;
                }
            }
            ctx.metrics.push_back(loadMetric);
        }

        std::string fragment = "output " + outputSourceName(source);
        if (lines > 0) {
            fragment += " (" + std::to_string(maxLoad) + "%)";
        }

        if (source != OUTPUT_SOURCE_NORMAL) {
            ctx.report.critical(fragment);
        } else {
            ctx.report.ok(fragment);
        }
    }
}
