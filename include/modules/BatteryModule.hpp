// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#ifndef SENTRY_BATTERY_MODULE_HPP
#define SENTRY_BATTERY_MODULE_HPP

#include "modules/SectionModule.hpp"

namespace Sentry::Modules {

    /**
     * @brief upsBattery csoport.
     * Hat metrika; a töredék csak OK vagy CRITICAL lehet, WARNING soha.
     */
    class BatteryModule : public ISectionModule {
    public:
        std::string getName() const override { return "BatteryModule"; }
        void run(EvaluationContext& ctx) override;
    };
}

#endif
