#include "UpsFixture.hpp"
#include "core/ProbeEngine.hpp"
#include "telemetry/PluginOutput.hpp"
#include <catch2/catch.hpp>

using namespace Sentry::Core;
using namespace SentryTest;

namespace {
    ProbeResult evaluate(const ValueMap& values, Sentry::Modules::EvaluationSettings settings = {}) {
        ValueStore store;
        store.merge(values);
        ProbeEngine engine(std::move(settings));
        return engine.evaluate(store);
    }
}

TEST_CASE("healthy UPS")
{
    auto result = evaluate(healthyValues());

    CHECK(result.severity == Severity::OK);
    CHECK(result.text == "Eaton 9PX 3000: battery normal (80%; 45min), output normal, no alarms, no test");
    CHECK(result.metrics.size() == 10);
    CHECK(renderPluginLine(result.severity, result.text, result.metrics, true).rfind("UPS OK - Eaton 9PX 3000: ", 0) == 0);
}

TEST_CASE("device identification falls back")
{
    auto values = healthyValues();
    values[SentryTemplates::IDENT_MANUFACTURER] = "  ";
    CHECK(evaluate(values).text.rfind("9PX 3000: ", 0) == 0);

    values.erase(SentryTemplates::IDENT_MODEL);
    CHECK(evaluate(values).text.rfind("unidentified UPS: ", 0) == 0);
}

TEST_CASE("two active alarms sharing a timestamp")
{
    auto values = healthyValues();
    values[SentryTemplates::ALARMS_PRESENT] = "2";
    addAlarm(values, 1, SentryTemplates::alarmOid(2), 500000);
    addAlarm(values, 2, SentryTemplates::alarmOid(3), 500000);

    auto result = evaluate(values);

    CHECK(result.severity == Severity::CRITICAL);
    CHECK(result.text.rfind("alarms: OnBattery, LowBattery(", 0) == 0);
    CHECK(result.text == "alarms: OnBattery, LowBattery(2h), OK: battery normal (80%; 45min), output normal, no test");
}

TEST_CASE("warning from the self-test after a critical battery")
{
    auto values = healthyValues();
    values[SentryTemplates::BATTERY_STATUS] = "3";
    values[SentryTemplates::TEST_ID] = SentryTemplates::TEST_IDS + ".2";
    values[SentryTemplates::TEST_RESULTS_SUMMARY] = "4";

    auto result = evaluate(values);

    CHECK(result.severity == Severity::CRITICAL);
    CHECK(result.text == "battery low (80%; 45min), OK: output normal, no alarms");
}

TEST_CASE("warning verdict")
{
    auto values = healthyValues();
    values[SentryTemplates::OUTPUT_NUM_LINES] = "1";
    addOutputLine(values, 1, 2300, 40, 920, 85);

    Sentry::Modules::EvaluationSettings settings;
    settings.loadThresholds = parseThresholdList("80", "90");

    auto result = evaluate(values, settings);

    CHECK(result.severity == Severity::WARNING);
    CHECK(result.text == "output line 1 load 85%, OK: battery normal (80%; 45min), output normal (85%), no alarms, no test");
    CHECK(exitCode(result.severity) == 1);
}

TEST_CASE("threshold count is validated against the output lines")
{
    auto values = healthyValues();
    values[SentryTemplates::OUTPUT_NUM_LINES] = "3";
    for (int line = 1; line <= 3; ++line) {
        addOutputLine(values, line, 2300, 10, 230, 20);
    }

    Sentry::Modules::EvaluationSettings two;
    two.loadThresholds = parseThresholdList("80,85", "90,95");
    CHECK_THROWS_AS(evaluate(values, two), ConfigError);

    Sentry::Modules::EvaluationSettings one;
    one.loadThresholds = parseThresholdList("80", "90");
    CHECK(evaluate(values, one).severity == Severity::OK);

    Sentry::Modules::EvaluationSettings three;
    three.loadThresholds = parseThresholdList("80,10,80", "90,95,90");
    auto result = evaluate(values, three);
    CHECK(result.severity == Severity::WARNING);
    CHECK(result.text.rfind("output line 2 load 20%", 0) == 0);
}

TEST_CASE("missing mandatory fields abort the evaluation")
{
    for (const auto& oid : { SentryTemplates::BATTERY_STATUS, SentryTemplates::SYS_UPTIME,
                             SentryTemplates::BYPASS_FREQUENCY, SentryTemplates::TEST_START_TIME }) {
        INFO(oid);
        auto values = healthyValues();
        values.erase(oid);
        CHECK_THROWS_AS(evaluate(values), DataError);
    }

    auto values = healthyValues();
    values.erase(SentryTemplates::BATTERY_STATUS);
    CHECK_THROWS_WITH(evaluate(values), Catch::Contains("battery status"));
}

TEST_CASE("engine run over a session")
{
    auto values = healthyValues();
    values[SentryTemplates::OUTPUT_NUM_LINES] = "2";
    addOutputLine(values, 1, 2300, 10, 230, 20);
    addOutputLine(values, 2, 2300, 12, 276, 24);

    FakeSession session(values);
    ProbeEngine engine(Sentry::Modules::EvaluationSettings{});
    auto result = engine.run(session);

    CHECK(session.requests.size() == 2);
    CHECK(result.severity == Severity::OK);
    CHECK(result.text == "Eaton 9PX 3000: battery normal (80%; 45min), output normal (24%), no alarms, no test");

    FakeSession failing(values);
    failing.failOnRequest = 1;
    CHECK_THROWS_AS(engine.run(failing), DataError);
}
