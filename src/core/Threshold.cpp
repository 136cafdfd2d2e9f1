// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#include "core/Threshold.hpp"
#include "core/Errors.hpp"
#include "utils/StringUtils.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace Sentry::Core {

    namespace {
        double parseBound(const std::string& token, const std::string& rangeText) {
            errno = 0;
            char* end = nullptr;
            double value = std::strtod(token.c_str(), &end);
            if (token.empty() || end != token.c_str() + token.size() || errno == ERANGE || !std::isfinite(value)) {
                throw ConfigError("invalid threshold range '" + rangeText + "'");
            }
            return value;
        }

        std::vector<std::string> splitList(const std::string& csv) {
            std::vector<std::string> items;
            if (SentryUtils::trim(csv).empty()) return items;
            for (const auto& item : SentryUtils::split(csv, ',')) {
                items.push_back(SentryUtils::trim(item));
            }
            return items;
        }
    }

    bool Range::alerts(double value) const {
        bool aboveStart = startInfinite || value >= start;
        bool belowEnd = endInfinite || value <= end;
        bool within = aboveStart && belowEnd;
        return inside ? within : !within;
    }

    Range parseRange(const std::string& text) {
        Range range;
        range.text = SentryUtils::trim(text);

        std::string body = range.text;
        if (!body.empty() && body.front() == '@') {
            range.inside = true;
            body.erase(0, 1);
        }
        if (body.empty()) {
            throw ConfigError("empty threshold range '" + text + "'");
        }

        size_t colon = body.find(':');
        if (colon == std::string::npos) {
            range.end = parseBound(body, text);
        } else {
            std::string left = body.substr(0, colon);
            std::string right = body.substr(colon + 1);

            if (left == "~") {
                range.startInfinite = true;
            } else if (!left.empty()) {
                range.start = parseBound(left, text);
            }

            if (right.empty()) {
                range.endInfinite = true;
            } else {
                range.end = parseBound(right, text);
            }
        }

        if (!range.startInfinite && !range.endInfinite && range.start > range.end) {
            throw ConfigError("threshold range '" + text + "' has start greater than end");
        }
        return range;
    }

    Severity ThresholdSpec::classify(double value) const {
        if (critical && critical->alerts(value)) return Severity::CRITICAL;
        if (warning && warning->alerts(value)) return Severity::WARNING;
        return Severity::OK;
    }

    std::vector<ThresholdSpec> parseThresholdList(const std::string& warningCsv,
                                                  const std::string& criticalCsv) {
        auto warnings = splitList(warningCsv);
        auto criticals = splitList(criticalCsv);

        if (!warnings.empty() && !criticals.empty() && warnings.size() != criticals.size()) {
            throw ConfigError("number of warning thresholds (" + std::to_string(warnings.size())
                              + ") does not match number of critical thresholds ("
                              + std::to_string(criticals.size()) + ")");
        }

        size_t count = std::max(warnings.size(), criticals.size());
        std::vector<ThresholdSpec> specs(count);
        for (size_t i = 0; i < count; ++i) {
            if (!warnings.empty()) specs[i].warning = parseRange(warnings[i]);
            if (!criticals.empty()) specs[i].critical = parseRange(criticals[i]);
        }
        return specs;
    }

    void validateThresholdCount(size_t specCount, int64_t lineCount) {
        if (specCount == 0 || specCount == 1) return;
        if (lineCount < 0 || specCount != static_cast<size_t>(lineCount)) {
            throw ConfigError(std::to_string(specCount) + " load thresholds given for "
                              + std::to_string(lineCount) + " output lines (expected 1 or "
                              + std::to_string(lineCount) + ")");
        }
    }

    const ThresholdSpec& thresholdForLine(const std::vector<ThresholdSpec>& specs, int64_t line) {
        if (specs.size() == 1) return specs.front();
        return specs.at(static_cast<size_t>(line - 1));
    }
}
