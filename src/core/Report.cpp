// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#include "core/Report.hpp"
#include "utils/StringUtils.hpp"
#include <stdexcept>

namespace Sentry::Core {

    const char* severityName(Severity severity) {
        switch (severity) {
            case Severity::OK: return "OK";
            case Severity::WARNING: return "WARNING";
            case Severity::CRITICAL: return "CRITICAL";
            case Severity::UNKNOWN: return "UNKNOWN";
        }
        return "UNKNOWN";
    }

    void Report::add(Severity severity, const std::string& fragment) {
        switch (severity) {
            case Severity::OK:
                okFragments.push_back(fragment);
                break;
            case Severity::WARNING:
                if (current == Severity::CRITICAL) return;
                warningFragments.push_back(fragment);
                current = Severity::WARNING;
                break;
            case Severity::CRITICAL:
                criticalFragments.push_back(fragment);
                current = Severity::CRITICAL;
                break;
            case Severity::UNKNOWN:
                throw std::logic_error("UNKNOWN is reserved for fatal errors: " + fragment);
        }
    }

    const std::vector<std::string>& Report::fragments(Severity severity) const {
        switch (severity) {
            case Severity::WARNING: return warningFragments;
            case Severity::CRITICAL: return criticalFragments;
            default: return okFragments;
        }
    }

    std::string Report::render(const std::string& head) const {
        using SentryUtils::join;

        if (current == Severity::OK) {
            if (okFragments.empty()) return head;
            return head + ": " + join(okFragments, ", ");
        }

        std::string text;
        if (current == Severity::CRITICAL) {
            text = join(criticalFragments, ", ");
            if (!warningFragments.empty()) {
                text += ", WARNING: " + join(warningFragments, ", ");
            }
        } else {
            text = join(warningFragments, ", ");
        }

        if (!okFragments.empty()) {
            text += ", OK: " + join(okFragments, ", ");
        }
        return text;
    }
}
