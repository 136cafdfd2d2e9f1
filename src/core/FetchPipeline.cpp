// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#include "core/FetchPipeline.hpp"
#include "rxcpp/rx.hpp"
#include <exception>
#include <iostream>

namespace Sentry::Core {

    using namespace SentryTemplates;

    FetchPipeline::FetchPipeline(Session& transport, ValueStore& values, size_t maxBatch, LogLevel level)
        : session(transport), store(values), batchSize(maxBatch == 0 ? 1 : maxBatch), currentLogLevel(level) {}

    void FetchPipeline::fetch(const std::vector<std::string>& oids) {
        if (oids.empty()) return;

        std::exception_ptr failure;

        // current_thread ütemező: a subscribe() visszatéréséig minden köteg lefut
        rxcpp::observable<>::iterate(oids)
            .buffer(static_cast<int>(batchSize))
            .subscribe(
                [this, &failure](const std::vector<std::string>& batch) {
                    // Az első hibás köteg után nincs több kérés
                    if (failure) return;

                    ++requestCount;
                    if (currentLogLevel == LogLevel::DEBUG) {
                        std::cerr << "[FetchPipeline] Request #" << requestCount
                                  << " with " << batch.size() << " OIDs" << std::endl;
                    }
                    try {
                        store.merge(session.fetch(batch));
                    } catch (const std::exception&) {
                        failure = std::current_exception();
                    }
                },
                [&failure](std::exception_ptr error) {
                    failure = error;
                });

        if (failure) {
            std::rethrow_exception(failure);
        }
    }

    std::vector<std::string> FetchPipeline::initialOids() {
        return {
            SYS_UPTIME,
            IDENT_MANUFACTURER,
            IDENT_MODEL,
            BATTERY_STATUS,
            BATTERY_SECONDS_ON_BATTERY,
            BATTERY_MINUTES_REMAINING,
            BATTERY_CHARGE_REMAINING,
            BATTERY_VOLTAGE,
            BATTERY_CURRENT,
            BATTERY_TEMPERATURE,
            INPUT_LINE_BADS,
            INPUT_NUM_LINES,
            OUTPUT_SOURCE,
            OUTPUT_FREQUENCY,
            OUTPUT_NUM_LINES,
            BYPASS_FREQUENCY,
            BYPASS_NUM_LINES,
            ALARMS_PRESENT,
            TEST_ID,
            TEST_RESULTS_SUMMARY,
            TEST_START_TIME
        };
    }

    TableSizes FetchPipeline::readTableSizes(const FieldAccessor& fields) {
        TableSizes sizes;
        sizes.inputLines = static_cast<int64_t>(fields.unsignedValue(INPUT_NUM_LINES, "number of input lines"));
        sizes.outputLines = static_cast<int64_t>(fields.unsignedValue(OUTPUT_NUM_LINES, "number of output lines"));
        sizes.bypassLines = static_cast<int64_t>(fields.unsignedValue(BYPASS_NUM_LINES, "number of bypass lines"));
        sizes.alarms = static_cast<int64_t>(fields.unsignedValue(ALARMS_PRESENT, "number of active alarms"));
        return sizes;
    }

    std::vector<std::string> FetchPipeline::tableOids(const TableSizes& sizes) {
        std::vector<std::string> oids;

        for (int64_t line = 1; line <= sizes.inputLines; ++line) {
            for (int column : {INPUT_COL_FREQUENCY, INPUT_COL_VOLTAGE, INPUT_COL_CURRENT, INPUT_COL_POWER}) {
                oids.push_back(tableCell(INPUT_ENTRY, column, line));
            }
        }
        for (int64_t line = 1; line <= sizes.outputLines; ++line) {
            for (int column : {OUTPUT_COL_VOLTAGE, OUTPUT_COL_CURRENT, OUTPUT_COL_POWER, OUTPUT_COL_LOAD}) {
                oids.push_back(tableCell(OUTPUT_ENTRY, column, line));
            }
        }
        for (int64_t line = 1; line <= sizes.bypassLines; ++line) {
            for (int column : {BYPASS_COL_VOLTAGE, BYPASS_COL_CURRENT, BYPASS_COL_POWER}) {
                oids.push_back(tableCell(BYPASS_ENTRY, column, line));
            }
        }
        for (int64_t row = 1; row <= sizes.alarms; ++row) {
            oids.push_back(tableCell(ALARM_ENTRY, ALARM_COL_DESCR, row));
            oids.push_back(tableCell(ALARM_ENTRY, ALARM_COL_TIME, row));
        }
        return oids;
    }

    void FetchPipeline::fetchInitial() {
        fetch(initialOids());
    }

    TableSizes FetchPipeline::fetchTables(const FieldAccessor& fields) {
        TableSizes sizes = readTableSizes(fields);

        if (currentLogLevel != LogLevel::SILENT) {
            std::cerr << "[FetchPipeline] Lines in/out/bypass: " << sizes.inputLines << "/"
                      << sizes.outputLines << "/" << sizes.bypassLines
                      << ", alarms: " << sizes.alarms << std::endl;
        }

        fetch(tableOids(sizes));
        return sizes;
    }

} // namespace Sentry::Core
