// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#include "core/FieldAccessor.hpp"
#include "core/Errors.hpp"
#include "utils/StringUtils.hpp"
#include <charconv>

namespace Sentry::Core {

    namespace {
        template <typename T>
        ParseResult<T> parseNumber(const std::string& raw, const char* kind) {
            std::string text = SentryUtils::trim(raw);
            if (text.empty()) {
                return ParseResult<T>::failure("empty value, expected " + std::string(kind));
            }

            T value{};
            const char* first = text.data();
            const char* last = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec != std::errc() || ptr != last) {
                return ParseResult<T>::failure("'" + raw + "' is not " + kind);
            }
            return ParseResult<T>::success(value);
        }
    }

    ParseResult<int64_t> parseInteger(const std::string& raw) {
        return parseNumber<int64_t>(raw, "an integer");
    }

    ParseResult<uint64_t> parseUnsigned(const std::string& raw) {
        return parseNumber<uint64_t>(raw, "a non-negative integer");
    }

    ParseResult<int64_t> parseCode(const std::string& raw, int64_t min, int64_t max) {
        auto result = parseInteger(raw);
        if (!result.ok()) {
            return result;
        }
        if (*result.value < min || *result.value > max) {
            return ParseResult<int64_t>::failure(
                "code " + std::to_string(*result.value) + " outside of "
                + std::to_string(min) + ".." + std::to_string(max));
        }
        return result;
    }

    ParseResult<std::string> parseObjectId(const std::string& raw) {
        std::string text = SentryUtils::trim(raw);
        if (!text.empty() && text.front() == '.') {
            text.erase(0, 1);
        }

        // Legalább két numerikus ív, pontokkal elválasztva
        auto arcs = SentryUtils::split(text, '.');
        if (arcs.size() < 2) {
            return ParseResult<std::string>::failure("'" + raw + "' is not a dotted identifier");
        }
        for (const auto& arc : arcs) {
            if (arc.empty() || arc.find_first_not_of("0123456789") != std::string::npos) {
                return ParseResult<std::string>::failure("'" + raw + "' is not a dotted identifier");
            }
        }
        return ParseResult<std::string>::success(text);
    }

    std::string FieldAccessor::raw(const std::string& oid, const std::string& description) const {
        auto value = store.find(oid);
        if (!value) {
            throw DataError("missing value for " + description + " (" + oid + ")");
        }
        return *value;
    }

    template <typename T>
    T FieldAccessor::require(const ParseResult<T>& result, const std::string& description) const {
        if (!result.ok()) {
            throw DataError("invalid value for " + description + ": " + result.reason);
        }
        return *result.value;
    }

    int64_t FieldAccessor::integer(const std::string& oid, const std::string& description) const {
        return require(parseInteger(raw(oid, description)), description);
    }

    uint64_t FieldAccessor::unsignedValue(const std::string& oid, const std::string& description) const {
        return require(parseUnsigned(raw(oid, description)), description);
    }

    int64_t FieldAccessor::code(const std::string& oid, int64_t min, int64_t max,
                                const std::string& description) const {
        return require(parseCode(raw(oid, description), min, max), description);
    }

    std::string FieldAccessor::objectId(const std::string& oid, const std::string& description) const {
        return require(parseObjectId(raw(oid, description)), description);
    }

    std::string FieldAccessor::text(const std::string& oid, const std::string& description) const {
        return raw(oid, description);
    }

    std::optional<std::string> FieldAccessor::optionalText(const std::string& oid) const {
        auto value = store.find(oid);
        if (!value) {
            return std::nullopt;
        }
        std::string text = SentryUtils::trim(*value);
        if (text.empty()) {
            return std::nullopt;
        }
        return text;
    }
}
