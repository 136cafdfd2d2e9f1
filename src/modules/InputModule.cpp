// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#include "modules/InputModule.hpp"
#include "utils/UpsMibTemplates.hpp"

namespace Sentry::Modules {

    using namespace SentryTemplates;
    using Sentry::Core::makeCounter;
    using Sentry::Core::makeMetric;

    void InputModule::run(EvaluationContext& ctx) {
        const auto& f = ctx.fields;

        uint64_t lineBads = f.unsignedValue(INPUT_LINE_BADS, "number of bad input events");
        ctx.metrics.push_back(makeCounter("input_line_bads", static_cast<double>(lineBads)));

        auto lines = static_cast<int64_t>(f.unsignedValue(INPUT_NUM_LINES, "number of input lines"));
        for (int64_t line = 1; line <= lines; ++line) {
            const std::string n = std::to_string(line);
            const std::string prefix = "input" + n + "_";

            double frequency = static_cast<double>(
                f.unsignedValue(tableCell(INPUT_ENTRY, INPUT_COL_FREQUENCY, line), "input " + n + " frequency")) * 0.1;
            double voltage = static_cast<double>(
                f.unsignedValue(tableCell(INPUT_ENTRY, INPUT_COL_VOLTAGE, line), "input " + n + " voltage")) * 0.1;
            double current = static_cast<double>(
                f.unsignedValue(tableCell(INPUT_ENTRY, INPUT_COL_CURRENT, line), "input " + n + " current")) * 0.1;
            uint64_t power = f.unsignedValue(tableCell(INPUT_ENTRY, INPUT_COL_POWER, line), "input " + n + " true power");

            ctx.metrics.push_back(makeMetric(prefix + "frequency", frequency, "Hz"));
            ctx.metrics.push_back(makeMetric(prefix + "voltage", voltage, "V"));
            ctx.metrics.push_back(makeMetric(prefix + "current", current, "A"));
            ctx.metrics.push_back(makeMetric(prefix + "power", static_cast<double>(power), "W"));
        }
    }
}
