// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#ifndef SENTRY_OUTPUT_MODULE_HPP
#define SENTRY_OUTPUT_MODULE_HPP

#include "modules/SectionModule.hpp"

namespace Sentry::Modules {

    /**
     * @brief upsOutput csoport.
     *
     * Vonalanként feszültség, áram, teljesítmény és terhelés. Ha van terhelési
     * küszöb, a vonal terhelése a hozzá tartozó küszöbpár szerint minősül
     * (egy pár: minden vonalra, N pár: vonalanként; a darabszámot
     * a ProbeEngine már az értékelés előtt ellenőrizte). A kimeneti forrás
     * "normal"-tól eltérő értéke mindig CRITICAL.
     */
    class OutputModule : public ISectionModule {
    public:
        std::string getName() const override { return "OutputModule"; }
        void run(EvaluationContext& ctx) override;
    };
}

#endif
