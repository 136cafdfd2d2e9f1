// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#ifndef SENTRY_BYPASS_MODULE_HPP
#define SENTRY_BYPASS_MODULE_HPP

#include "modules/SectionModule.hpp"

namespace Sentry::Modules {

    // upsBypass: az InputModule tükörképe, csak metrikák
    class BypassModule : public ISectionModule {
    public:
        std::string getName() const override { return "BypassModule"; }
        void run(EvaluationContext& ctx) override;
    };
}

#endif
