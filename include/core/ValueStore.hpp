// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#ifndef SENTRY_VALUE_STORE_HPP
#define SENTRY_VALUE_STORE_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace Sentry::Core {

    using ValueMap = std::map<std::string, std::string>;

    /**
     * @brief OID -> nyers érték tár. Kulcsonként egyszer írható, utána csak olvasható.
     */
    class ValueStore {
    private:
        ValueMap values;

    public:
        // Már meglévő kulcsot nem ír felül; false, ha a kulcs foglalt volt
        bool insert(const std::string& oid, const std::string& value);
        void merge(const ValueMap& batch);

        [[nodiscard]] std::optional<std::string> find(const std::string& oid) const;
        [[nodiscard]] bool contains(const std::string& oid) const;
        [[nodiscard]] size_t size() const { return values.size(); }
    };
}

#endif
