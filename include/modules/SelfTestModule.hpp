// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#ifndef SENTRY_SELF_TEST_MODULE_HPP
#define SENTRY_SELF_TEST_MODULE_HPP

#include "modules/SectionModule.hpp"

namespace Sentry::Modules {

    /**
     * @brief upsTest csoport: az utolsó önteszt eredménye.
     *
     * noTestsInitiated -> "no test", inProgress -> "test running",
     * passed -> "test passed". A warning/error/aborted eredmény csak akkor
     * kerül a riportba, ha a felhasználó nem tiltotta le.
     */
    class SelfTestModule : public ISectionModule {
    public:
        std::string getName() const override { return "SelfTestModule"; }
        void run(EvaluationContext& ctx) override;
    };
}

#endif
