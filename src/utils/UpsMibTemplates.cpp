// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#include "utils/UpsMibTemplates.hpp"
#include "utils/StringUtils.hpp"

namespace SentryTemplates {

    namespace {
        std::string lookup(const std::vector<std::string>& table, int64_t code) {
            if (code >= 1 && static_cast<size_t>(code) <= table.size()) {
                return table[static_cast<size_t>(code - 1)];
            }
            return std::to_string(code);
        }

        // "<prefix>.<n>" -> n, ha az OID a prefix alá tartozik és n a táblában van
        std::optional<size_t> indexUnder(const std::string& oid, const std::string& prefix, size_t tableSize) {
            if (oid.size() <= prefix.size() + 1) return std::nullopt;
            if (oid.compare(0, prefix.size(), prefix) != 0 || oid[prefix.size()] != '.') return std::nullopt;

            std::string tail = oid.substr(prefix.size() + 1);
            if (tail.empty() || tail.size() > 3) return std::nullopt;
            for (char c : tail) {
                if (c < '0' || c > '9') return std::nullopt;
            }
            size_t n = std::stoul(tail);
            if (n < 1 || n > tableSize) return std::nullopt;
            return n;
        }
    }

    std::string tableCell(const std::string& entry, int column, int64_t row) {
        return entry + "." + std::to_string(column) + "." + std::to_string(row);
    }

    std::string batteryStatusName(int64_t code) {
        return lookup(BATTERY_STATUS_NAMES, code);
    }

    std::string outputSourceName(int64_t code) {
        return lookup(OUTPUT_SOURCE_NAMES, code);
    }

    std::string alarmOid(int index) {
        return WELL_KNOWN_ALARMS + "." + std::to_string(index);
    }

    std::optional<std::string> alarmOidByName(const std::string& name) {
        const std::string wanted = SentryUtils::toLower(name);
        for (size_t i = 0; i < ALARM_NAMES.size(); ++i) {
            if (SentryUtils::toLower(ALARM_NAMES[i]) == wanted) {
                return alarmOid(static_cast<int>(i + 1));
            }
        }
        return std::nullopt;
    }

    std::string alarmName(const std::string& oid) {
        auto index = indexUnder(oid, WELL_KNOWN_ALARMS, ALARM_NAMES.size());
        return index ? ALARM_NAMES[*index - 1] : oid;
    }

    std::string testName(const std::string& oid) {
        auto index = indexUnder(oid, TEST_IDS, TEST_NAMES.size());
        return index ? TEST_NAMES[*index - 1] : oid;
    }

    bool isNoTestsInitiated(const std::string& oid) {
        return oid == TEST_IDS + ".1";
    }
}
