// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "config/ProbeOptions.hpp"
#include "core/Errors.hpp"
#include "core/ProbeEngine.hpp"
#include "core/SnmpSession.hpp"
#include "telemetry/PluginOutput.hpp"
#include "utils/UpsMibTemplates.hpp"

using Sentry::Core::Severity;

namespace {
    // Minden hiba egyetlen UNKNOWN sorként jelenik meg a monitorozó rendszer felé
    int reportUnknown(const std::string& message) {
        std::cout << SentryTemplates::PLUGIN_NAME << " UNKNOWN - " << message << std::endl;
        return Sentry::Core::exitCode(Severity::UNKNOWN);
    }
}

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "check_ups";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    try {
        Sentry::Config::ProbeOptions options = Sentry::Config::parseOptions(args);

        if (options.showHelp) {
            std::cout << Sentry::Config::usage(program);
            return Sentry::Core::exitCode(Severity::UNKNOWN);
        }
        if (options.showVersion) {
            std::cout << program << " " << SentryTemplates::PROBE_VERSION << std::endl;
            return Sentry::Core::exitCode(Severity::UNKNOWN);
        }

        auto level = Sentry::Core::logLevelFromVerbosity(options.verbosity);
        if (level != Sentry::Core::LogLevel::SILENT) {
            std::cerr << "[Main] probing " << options.snmp.hostname << ":" << options.snmp.port << std::endl;
        }

        // --- Fetch & evaluate ---
        Sentry::Core::SnmpSession session(options.snmp, level);
        Sentry::Core::ProbeEngine engine(options.evaluation, level);
        Sentry::Core::ProbeResult result = engine.run(session);

        std::cout << Sentry::Core::renderPluginLine(result.severity, result.text,
                                                    result.metrics, options.perfData)
                  << std::endl;
        return Sentry::Core::exitCode(result.severity);

    } catch (const Sentry::Core::ConfigError& e) {
        return reportUnknown(std::string(e.what()) + " (see --help)");
    } catch (const Sentry::Core::DataError& e) {
        return reportUnknown(e.what());
    } catch (const std::exception& e) {
        return reportUnknown(std::string("internal error: ") + e.what());
    }
}
