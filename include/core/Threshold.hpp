// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe
// Threshold Engine: monitoring-plugin style ranges for per-line output load

#ifndef SENTRY_THRESHOLD_HPP
#define SENTRY_THRESHOLD_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/Report.hpp"

namespace Sentry::Core {

    /**
     * @brief "[@][start:][end]" tartomány.
     * A "~" kezdet mínusz végtelen, a hiányzó vég plusz végtelen.
     * Riaszt, ha az érték a tartományon kívül esik (vagy belül, '@' esetén).
     */
    struct Range {
        double start = 0.0;
        double end = 0.0;
        bool startInfinite = false;
        bool endInfinite = false;
        bool inside = false;
        std::string text;

        [[nodiscard]] bool alerts(double value) const;
    };

    // ConfigError, ha a szöveg nem értelmezhető
    Range parseRange(const std::string& text);

    struct ThresholdSpec {
        std::optional<Range> warning;
        std::optional<Range> critical;

        [[nodiscard]] Severity classify(double value) const;

        [[nodiscard]] std::string warningText() const { return warning ? warning->text : ""; }
        [[nodiscard]] std::string criticalText() const { return critical ? critical->text : ""; }
    };

    /**
     * @brief Vesszővel elválasztott warning/critical listák párosítása.
     * Ha mindkettő meg van adva, a darabszámnak egyeznie kell; a hiányzó oldal üres marad.
     */
    std::vector<ThresholdSpec> parseThresholdList(const std::string& warningCsv,
                                                  const std::string& criticalCsv);

    // 1 küszöbpár: minden vonalra; N pár: vonalanként. Más darabszám ConfigError.
    void validateThresholdCount(size_t specCount, int64_t lineCount);

    const ThresholdSpec& thresholdForLine(const std::vector<ThresholdSpec>& specs, int64_t line);
}

#endif
