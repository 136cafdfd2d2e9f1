// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#include "telemetry/PluginOutput.hpp"
#include "utils/StringUtils.hpp"
#include "utils/UpsMibTemplates.hpp"

namespace Sentry::Core {

namespace {
    std::string quoteLabel(const std::string& label) {
        if (label.find_first_of(" ='") == std::string::npos) {
            return label;
        }
        std::string quoted = "'";
        for (char c : label) {
            if (c == '\'') quoted += "''";
            else quoted += c;
        }
        return quoted + "'";
    }
}

std::string renderMetric(const Metric& metric) {
    std::vector<std::string> fields = {
        SentryUtils::formatNumber(metric.value) + metric.unit,
        metric.warning,
        metric.critical,
        metric.min ? SentryUtils::formatNumber(*metric.min) : "",
        metric.max ? SentryUtils::formatNumber(*metric.max) : ""
    };

    while (fields.size() > 1 && fields.back().empty()) {
        fields.pop_back();
    }
    return quoteLabel(metric.label) + "=" + SentryUtils::join(fields, ";");
}

std::string renderPerfData(const std::vector<Metric>& metrics) {
    std::vector<std::string> items;
    items.reserve(metrics.size());
    for (const auto& metric : metrics) {
        items.push_back(renderMetric(metric));
    }
    return SentryUtils::join(items, " ");
}

std::string renderPluginLine(Severity severity, const std::string& text,
                             const std::vector<Metric>& metrics, bool perfData) {
    std::string line = SentryTemplates::PLUGIN_NAME + " " + severityName(severity) + " - " + text;
    if (perfData && !metrics.empty()) {
        line += " | " + renderPerfData(metrics);
    }
    return line;
}

}
