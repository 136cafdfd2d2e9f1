// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#ifndef SENTRY_PROBE_OPTIONS_HPP
#define SENTRY_PROBE_OPTIONS_HPP

#include <string>
#include <vector>

#include "core/Session.hpp"
#include "modules/SectionModule.hpp"

namespace Sentry::Config {

    struct ProbeOptions {
        Sentry::Core::SnmpSettings snmp;
        Sentry::Modules::EvaluationSettings evaluation;

        int verbosity = 0;
        bool perfData = true;

        bool showHelp = false;
        bool showVersion = false;
    };

    /**
     * @brief Szigorú parancssor-feldolgozás (argv[0] nélkül).
     *
     * Ismeretlen opció, hiányzó érték, hibás szám, nem támogatott
     * riasztás-token, értelmezhetetlen küszöb vagy fölösleges operandus
     * ConfigError kivételt dob.
     */
    ProbeOptions parseOptions(const std::vector<std::string>& args);

    std::string usage(const std::string& program);
}

#endif
