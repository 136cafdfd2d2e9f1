// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#include "modules/AlarmModule.hpp"
#include "utils/StringUtils.hpp"
#include "utils/UpsMibTemplates.hpp"

namespace Sentry::Modules {

    using namespace SentryTemplates;

    namespace {
        std::string ignoredText(size_t count) {
            return std::to_string(count) + (count == 1 ? " alarm ignored" : " alarms ignored");
        }
    }

    std::vector<AlarmEntry> AlarmModule::collect(const EvaluationContext& ctx) {
        const auto& f = ctx.fields;
        auto count = static_cast<int64_t>(f.unsignedValue(ALARMS_PRESENT, "number of active alarms"));

        std::vector<AlarmEntry> alarms;
        for (int64_t row = 1; row <= count; ++row) {
            const std::string n = std::to_string(row);

            AlarmEntry entry;
            entry.oid = f.objectId(tableCell(ALARM_ENTRY, ALARM_COL_DESCR, row), "alarm " + n + " identifier");
            entry.since = f.unsignedValue(tableCell(ALARM_ENTRY, ALARM_COL_TIME, row), "alarm " + n + " time");
            entry.name = alarmName(entry.oid);
            entry.ignored = ctx.settings.ignoredAlarms.matches(entry.oid, entry.name);
            alarms.push_back(entry);
        }
        return alarms;
    }

    std::vector<std::string> AlarmModule::displayNames(const std::vector<AlarmEntry>& active, uint64_t uptime) {
        std::vector<std::string> names;
        for (size_t i = 0; i < active.size(); ++i) {
            bool trailing = (i + 1 == active.size()) || active[i].since != active[i + 1].since;
            if (!trailing) {
                names.push_back(active[i].name);
                continue;
            }
            uint64_t elapsed = uptime > active[i].since ? uptime - active[i].since : 0;
            names.push_back(active[i].name + "(" + SentryUtils::formatDuration(elapsed) + ")");
        }
        return names;
    }

    void AlarmModule::run(EvaluationContext& ctx) {
        auto alarms = collect(ctx);
        ctx.metrics.push_back(Sentry::Core::makeCounter("alarms", static_cast<double>(alarms.size())));

        std::vector<AlarmEntry> active;
        size_t ignored = 0;
        for (const auto& alarm : alarms) {
            if (alarm.ignored) {
                ++ignored;
            } else {
                active.push_back(alarm);
            }
        }

        if (!active.empty()) {
            ctx.report.critical("alarms: " + SentryUtils::join(displayNames(active, ctx.uptime), ", "));
            if (ignored > 0) {
                ctx.report.critical(ignoredText(ignored));
            }
        } else if (ignored > 0) {
            ctx.report.ok(ignoredText(ignored));
        } else {
            ctx.report.ok("no alarms");
        }
    }
}
