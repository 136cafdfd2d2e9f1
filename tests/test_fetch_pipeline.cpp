#include "UpsFixture.hpp"
#include "core/FetchPipeline.hpp"
#include <catch2/catch.hpp>

using namespace Sentry::Core;
using namespace SentryTest;

namespace {
    std::vector<std::string> numberedOids(size_t count) {
        std::vector<std::string> oids;
        for (size_t i = 1; i <= count; ++i) {
            oids.push_back("1.3.6.1.4.1.99999." + std::to_string(i) + ".0");
        }
        return oids;
    }
}

TEST_CASE("fetch is split into bounded batches")
{
    struct {
        size_t oids;
        std::vector<size_t> batches;
    } testVector[] = {
        { 0, {} },
        { 1, { 1 } },
        { 40, { 40 } },
        { 41, { 40, 1 } },
        { 100, { 40, 40, 20 } },
    };

    for (auto& it : testVector) {
        INFO(it.oids << " OIDs");
        FakeSession session;
        ValueStore store;
        FetchPipeline pipeline(session, store, 40);
        pipeline.fetch(numberedOids(it.oids));

        std::vector<size_t> sizes;
        for (const auto& request : session.requests) sizes.push_back(request.size());
        CHECK(sizes == it.batches);
        CHECK(pipeline.requests() == it.batches.size());
    }
}

TEST_CASE("fetched values are merged and absent ones skipped")
{
    auto oids = numberedOids(50);
    FakeSession session({ { oids[0], "1" }, { oids[45], "46" } });
    ValueStore store;
    FetchPipeline pipeline(session, store, 40);
    pipeline.fetch(oids);

    CHECK(store.size() == 2);
    CHECK(*store.find(oids[45]) == "46");
    CHECK_FALSE(store.contains(oids[1]));
}

TEST_CASE("a failed batch aborts the fetch")
{
    FakeSession session;
    session.failOnRequest = 2;
    ValueStore store;
    FetchPipeline pipeline(session, store, 40);

    CHECK_THROWS_WITH(pipeline.fetch(numberedOids(100)), "Timeout");
    CHECK(session.requests.size() == 2);
    CHECK(pipeline.requests() == 2);
}

TEST_CASE("table identifiers follow the fetched counts")
{
    CHECK(FetchPipeline::initialOids().size() == 21);
    CHECK(FetchPipeline::initialOids().front() == SentryTemplates::SYS_UPTIME);

    TableSizes sizes;
    sizes.inputLines = 1;
    sizes.outputLines = 3;
    sizes.bypassLines = 1;
    sizes.alarms = 2;

    auto oids = FetchPipeline::tableOids(sizes);
    REQUIRE(oids.size() == 4 + 3 * 4 + 3 + 2 * 2);
    CHECK(oids.front() == "1.3.6.1.2.1.33.1.3.3.1.2.1");
    CHECK(oids.back() == "1.3.6.1.2.1.33.1.6.2.1.3.2");

    CHECK(FetchPipeline::tableOids(TableSizes{}).empty());
}

TEST_CASE("two phase fetch")
{
    auto values = healthyValues();
    values[SentryTemplates::INPUT_NUM_LINES] = "3";
    values[SentryTemplates::OUTPUT_NUM_LINES] = "3";
    values[SentryTemplates::BYPASS_NUM_LINES] = "3";
    values[SentryTemplates::ALARMS_PRESENT] = "10";
    for (int line = 1; line <= 3; ++line) {
        addInputLine(values, line, 500, 2300, 10, 200);
        addOutputLine(values, line, 2300, 10, 200, 30);
        addBypassLine(values, line, 2300, 0, 0);
    }
    for (int row = 1; row <= 10; ++row) {
        addAlarm(values, row, SentryTemplates::alarmOid(row), 500);
    }

    FakeSession session(values);
    ValueStore store;
    FieldAccessor fields(store);
    FetchPipeline pipeline(session, store, 40);

    pipeline.fetchInitial();
    CHECK(pipeline.requests() == 1);

    TableSizes sizes = pipeline.fetchTables(fields);
    CHECK(sizes.alarms == 10);
    // 12 + 12 + 9 + 20 = 53 OID -> 2 kérés
    CHECK(pipeline.requests() == 3);
    CHECK(store.size() == values.size());

    for (const auto& request : session.requests) {
        CHECK(request.size() <= SentryTemplates::MAX_OIDS_PER_REQUEST);
    }
}

TEST_CASE("missing table counts are data errors")
{
    auto values = healthyValues();
    values.erase(SentryTemplates::OUTPUT_NUM_LINES);

    FakeSession session(values);
    ValueStore store;
    FieldAccessor fields(store);
    FetchPipeline pipeline(session, store, 40);

    pipeline.fetchInitial();
    CHECK_THROWS_AS(pipeline.fetchTables(fields), DataError);
}
