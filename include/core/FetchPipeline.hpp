// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe
// Two-phase fetch: fixed scalars first, then the tables sized by the fetched counts

#ifndef SENTRY_FETCH_PIPELINE_HPP
#define SENTRY_FETCH_PIPELINE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/FieldAccessor.hpp"
#include "core/Session.hpp"
#include "core/ValueStore.hpp"
#include "utils/UpsMibTemplates.hpp"

namespace Sentry::Core {

    struct TableSizes {
        int64_t inputLines = 0;
        int64_t outputLines = 0;
        int64_t bypassLines = 0;
        int64_t alarms = 0;
    };

    /**
     * @brief Kötegelt lekérdezés: a kérések listáját rxcpp stream vágja
     * legfeljebb batchSize méretű darabokra, az eredmény a ValueStore-ba kerül.
     * Bármely köteg hibája megszakítja a streamet, és a hívó felé továbbdobódik.
     */
    class FetchPipeline {
    private:
        Session& session;
        ValueStore& store;
        size_t batchSize;
        LogLevel currentLogLevel;
        size_t requestCount{0};

    public:
        FetchPipeline(Session& transport, ValueStore& values,
                      size_t maxBatch = SentryTemplates::MAX_OIDS_PER_REQUEST,
                      LogLevel level = LogLevel::SILENT);

        void fetch(const std::vector<std::string>& oids);

        // --- Phase 1 / Phase 2 ---
        void fetchInitial();
        TableSizes fetchTables(const FieldAccessor& fields);

        static std::vector<std::string> initialOids();
        static std::vector<std::string> tableOids(const TableSizes& sizes);
        static TableSizes readTableSizes(const FieldAccessor& fields);

        [[nodiscard]] size_t requests() const { return requestCount; }
    };
}

#endif
