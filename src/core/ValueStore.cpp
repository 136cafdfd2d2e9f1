// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#include "core/ValueStore.hpp"

namespace Sentry::Core {

    bool ValueStore::insert(const std::string& oid, const std::string& value) {
        return values.emplace(oid, value).second;
    }

    void ValueStore::merge(const ValueMap& batch) {
        for (const auto& [oid, value] : batch) {
            insert(oid, value);
        }
    }

    std::optional<std::string> ValueStore::find(const std::string& oid) const {
        auto it = values.find(oid);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool ValueStore::contains(const std::string& oid) const {
        return values.count(oid) > 0;
    }
}
