// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#pragma once

#include <string>
#include <vector>

#include "core/Report.hpp"
#include "telemetry/Metric.hpp"

namespace Sentry::Core {

// label=value<unit>;warn;crit;min;max, a záró üres mezők nélkül
std::string renderMetric(const Metric& metric);

std::string renderPerfData(const std::vector<Metric>& metrics);

/**
 * @brief "UPS <STATE> - <text>[ | <perfdata>]"
 * A perfdata rész elmarad, ha ki van kapcsolva vagy nincs metrika.
 */
std::string renderPluginLine(Severity severity, const std::string& text,
                             const std::vector<Metric>& metrics, bool perfData);

inline int exitCode(Severity severity) {
    return static_cast<int>(severity);
}

}
