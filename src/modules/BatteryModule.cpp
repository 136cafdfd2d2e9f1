// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#include "modules/BatteryModule.hpp"
#include "utils/UpsMibTemplates.hpp"

namespace Sentry::Modules {

    using namespace SentryTemplates;
    using Sentry::Core::makeBoundedMetric;
    using Sentry::Core::makeMetric;
    using Sentry::Core::makeSignedMetric;

    void BatteryModule::run(EvaluationContext& ctx) {
        const auto& f = ctx.fields;

        int64_t status = f.code(BATTERY_STATUS, 1, static_cast<int64_t>(BATTERY_STATUS_NAMES.size()), "battery status");
        uint64_t secondsOnBattery = f.unsignedValue(BATTERY_SECONDS_ON_BATTERY, "seconds on battery");
        uint64_t minutesRemaining = f.unsignedValue(BATTERY_MINUTES_REMAINING, "estimated minutes remaining");
        int64_t charge = f.code(BATTERY_CHARGE_REMAINING, 0, 100, "estimated charge remaining");
        double voltage = static_cast<double>(f.integer(BATTERY_VOLTAGE, "battery voltage")) * 0.1;
        double current = static_cast<double>(f.integer(BATTERY_CURRENT, "battery current")) * 0.1;
        int64_t temperature = f.integer(BATTERY_TEMPERATURE, "battery temperature");

        ctx.metrics.push_back(makeMetric("battery_seconds", static_cast<double>(secondsOnBattery), "s"));
        ctx.metrics.push_back(makeMetric("battery_minutes", static_cast<double>(minutesRemaining)));
        ctx.metrics.push_back(makeBoundedMetric("battery_charge", static_cast<double>(charge), "%", 0, 100));
        ctx.metrics.push_back(makeMetric("battery_voltage", voltage, "V"));
        ctx.metrics.push_back(makeSignedMetric("battery_current", current, "A"));
        ctx.metrics.push_back(makeSignedMetric("battery_temperature", static_cast<double>(temperature), "C"));

        std::string fragment = "battery " + batteryStatusName(status)
                               + " (" + std::to_string(charge) + "%; "
                               + std::to_string(minutesRemaining) + "min)";

        if (status != BATTERY_STATUS_NORMAL) {
            ctx.report.critical(fragment);
        } else {
            ctx.report.ok(fragment);
        }
    }
}
