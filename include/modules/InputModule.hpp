// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#ifndef SENTRY_INPUT_MODULE_HPP
#define SENTRY_INPUT_MODULE_HPP

#include "modules/SectionModule.hpp"

namespace Sentry::Modules {

    // upsInput: csak metrikák, állapotot nem befolyásol
    class InputModule : public ISectionModule {
    public:
        std::string getName() const override { return "InputModule"; }
        void run(EvaluationContext& ctx) override;
    };
}

#endif
