// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#include "core/AlarmFilter.hpp"
#include "core/Errors.hpp"
#include "core/FieldAccessor.hpp"
#include "utils/StringUtils.hpp"
#include "utils/UpsMibTemplates.hpp"

namespace Sentry::Core {

    void AlarmFilter::add(const std::string& token) {
        std::string text = SentryUtils::trim(token);
        if (text.empty()) {
            throw ConfigError("empty alarm in ignore list");
        }

        // 1. Bare number -> upsWellKnownAlarms.<n>
        if (text.find_first_not_of("0123456789") == std::string::npos) {
            auto number = parseCode(text, 1, static_cast<int64_t>(SentryTemplates::ALARM_NAMES.size()));
            if (!number.ok()) {
                throw ConfigError("unsupported alarm to ignore '" + text + "': " + number.reason);
            }
            oids.insert(SentryTemplates::alarmOid(static_cast<int>(*number.value)));
            return;
        }

        // 2. Full dotted identifier
        if (text.find('.') != std::string::npos) {
            auto oid = parseObjectId(text);
            if (!oid.ok()) {
                throw ConfigError("unsupported alarm to ignore '" + text + "': " + oid.reason);
            }
            oids.insert(*oid.value);
            return;
        }

        // 3. Well-known name
        auto byName = SentryTemplates::alarmOidByName(text);
        if (!byName) {
            throw ConfigError("unsupported alarm to ignore '" + text + "'");
        }
        oids.insert(*byName);
    }

    void AlarmFilter::addList(const std::string& csv) {
        for (const auto& token : SentryUtils::split(csv, ',')) {
            add(token);
        }
    }

    bool AlarmFilter::matches(const std::string& oid, const std::string& name) const {
        if (oids.count(oid) > 0) return true;

        auto byName = SentryTemplates::alarmOidByName(name);
        return byName && oids.count(*byName) > 0;
    }
}
