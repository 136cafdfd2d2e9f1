// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#include "modules/BypassModule.hpp"
#include "utils/UpsMibTemplates.hpp"

namespace Sentry::Modules {

    using namespace SentryTemplates;
    using Sentry::Core::makeMetric;

    void BypassModule::run(EvaluationContext& ctx) {
        const auto& f = ctx.fields;

        double frequency = static_cast<double>(f.unsignedValue(BYPASS_FREQUENCY, "bypass frequency")) * 0.1;
        ctx.metrics.push_back(makeMetric("bypass_frequency", frequency, "Hz"));

        auto lines = static_cast<int64_t>(f.unsignedValue(BYPASS_NUM_LINES, "number of bypass lines"));
        for (int64_t line = 1; line <= lines; ++line) {
            const std::string n = std::to_string(line);
            const std::string prefix = "bypass" + n + "_";

            double voltage = static_cast<double>(
                f.unsignedValue(tableCell(BYPASS_ENTRY, BYPASS_COL_VOLTAGE, line), "bypass " + n + " voltage")) * 0.1;
            double current = static_cast<double>(
                f.unsignedValue(tableCell(BYPASS_ENTRY, BYPASS_COL_CURRENT, line), "bypass " + n + " current")) * 0.1;
            uint64_t power = f.unsignedValue(tableCell(BYPASS_ENTRY, BYPASS_COL_POWER, line), "bypass " + n + " power");

            ctx.metrics.push_back(makeMetric(prefix + "voltage", voltage, "V"));
            ctx.metrics.push_back(makeMetric(prefix + "current", current, "A"));
            ctx.metrics.push_back(makeMetric(prefix + "power", static_cast<double>(power), "W"));
        }
    }
}
