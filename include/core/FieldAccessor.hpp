// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe
// Typed extraction of mandatory fields from the value store

#ifndef SENTRY_FIELD_ACCESSOR_HPP
#define SENTRY_FIELD_ACCESSOR_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "core/ValueStore.hpp"

namespace Sentry::Core {

    /**
     * @brief Egy mező értelmezésének eredménye: vagy érték, vagy a hiba oka.
     */
    template <typename T>
    struct ParseResult {
        std::optional<T> value;
        std::string reason;

        static ParseResult success(T v) { return ParseResult{std::move(v), {}}; }
        static ParseResult failure(std::string why) { return ParseResult{std::nullopt, std::move(why)}; }

        [[nodiscard]] bool ok() const { return value.has_value(); }
    };

    // --- Typed parsers ---

    ParseResult<int64_t> parseInteger(const std::string& raw);
    ParseResult<uint64_t> parseUnsigned(const std::string& raw);

    // Egész szám a [min, max] felsorolt tartományban
    ParseResult<int64_t> parseCode(const std::string& raw, int64_t min, int64_t max);

    // Pontozott azonosító (1.3.6.1...), a vezető pont levágva
    ParseResult<std::string> parseObjectId(const std::string& raw);

    /**
     * @brief Kötelező mezők olvasása a ValueStore-ból.
     *
     * Hiányzó vagy a mintának nem megfelelő érték DataError kivételt dob,
     * amely megnevezi a mező ember által olvasható leírását. Részleges eredmény nincs.
     */
    class FieldAccessor {
    private:
        const ValueStore& store;

        std::string raw(const std::string& oid, const std::string& description) const;

        template <typename T>
        T require(const ParseResult<T>& result, const std::string& description) const;

    public:
        explicit FieldAccessor(const ValueStore& valueStore) : store(valueStore) {}

        int64_t integer(const std::string& oid, const std::string& description) const;
        uint64_t unsignedValue(const std::string& oid, const std::string& description) const;
        int64_t code(const std::string& oid, int64_t min, int64_t max, const std::string& description) const;
        std::string objectId(const std::string& oid, const std::string& description) const;
        std::string text(const std::string& oid, const std::string& description) const;

        // Nem kötelező mező (pl. azonosító szöveg); hiány esetén nullopt
        std::optional<std::string> optionalText(const std::string& oid) const;
    };
}

#endif
