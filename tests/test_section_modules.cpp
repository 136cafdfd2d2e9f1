#include "UpsFixture.hpp"
#include "modules/AlarmModule.hpp"
#include "modules/BatteryModule.hpp"
#include "modules/BypassModule.hpp"
#include "modules/InputModule.hpp"
#include "modules/OutputModule.hpp"
#include "modules/SelfTestModule.hpp"
#include <catch2/catch.hpp>

using namespace Sentry::Core;
using namespace Sentry::Modules;
using namespace SentryTest;

TEST_CASE("battery section")
{
    SECTION("normal battery")
    {
        ModuleHarness h(healthyValues());
        BatteryModule battery;
        h.run(battery);

        CHECK(h.report.level() == Severity::OK);
        CHECK(h.fragments(Severity::OK) == std::vector<std::string>{ "battery normal (80%; 45min)" });
        REQUIRE(h.metrics.size() == 6);
        CHECK(h.metric("battery_charge")->max == 100.0);
        CHECK(h.metric("battery_voltage")->value == Approx(54.5));
        CHECK(h.metric("battery_current")->value == Approx(-1.2));
        CHECK_FALSE(h.metric("battery_current")->min);
        CHECK(h.metric("battery_temperature")->unit == "C");
    }

    SECTION("abnormal status codes are critical")
    {
        struct {
            std::string code;
            std::string fragment;
        } testVector[] = {
            { "1", "battery unknown (80%; 45min)" },
            { "3", "battery low (80%; 45min)" },
            { "4", "battery depleted (80%; 45min)" },
        };

        for (auto& it : testVector) {
            auto values = healthyValues();
            values[SentryTemplates::BATTERY_STATUS] = it.code;
            ModuleHarness h(values);
            BatteryModule battery;
            h.run(battery);

            CHECK(h.report.level() == Severity::CRITICAL);
            CHECK(h.fragments(Severity::CRITICAL) == std::vector<std::string>{ it.fragment });
        }
    }

    SECTION("out of range values are data errors")
    {
        for (auto field : { std::make_pair(SentryTemplates::BATTERY_STATUS, "5"),
                            std::make_pair(SentryTemplates::BATTERY_CHARGE_REMAINING, "101"),
                            std::make_pair(SentryTemplates::BATTERY_MINUTES_REMAINING, "-1") }) {
            auto values = healthyValues();
            values[field.first] = field.second;
            ModuleHarness h(values);
            BatteryModule battery;
            CHECK_THROWS_AS(h.run(battery), DataError);
        }
    }
}

TEST_CASE("input and bypass sections emit metrics only")
{
    auto values = healthyValues();
    values[SentryTemplates::INPUT_NUM_LINES] = "2";
    addInputLine(values, 1, 499, 2301, 12, 250);
    addInputLine(values, 2, 501, 2299, 11, 240);
    values[SentryTemplates::BYPASS_NUM_LINES] = "1";
    addBypassLine(values, 1, 2300, 0, 0);

    ModuleHarness h(values);
    InputModule input;
    BypassModule bypass;
    h.run(input);
    h.run(bypass);

    CHECK(h.report.level() == Severity::OK);
    CHECK(h.fragments(Severity::OK).empty());
    CHECK(h.metrics.size() == 1 + 2 * 4 + 1 + 3);

    CHECK(h.metrics.front().label == "input_line_bads");
    CHECK(h.metrics.front().unit == "c");
    CHECK(h.metric("input1_frequency")->value == Approx(49.9));
    CHECK(h.metric("input2_voltage")->value == Approx(229.9));
    CHECK(h.metric("input2_power")->value == Approx(240));
    CHECK(h.metric("bypass_frequency")->value == Approx(50.0));
    CHECK(h.metric("bypass1_voltage")->unit == "V");
}

TEST_CASE("input line count drives the mandatory fields")
{
    auto values = healthyValues();
    values[SentryTemplates::INPUT_NUM_LINES] = "2";
    addInputLine(values, 1, 500, 2300, 12, 250);

    ModuleHarness h(values);
    InputModule input;
    CHECK_THROWS_WITH(h.run(input), Catch::Contains("input 2 frequency"));
}

TEST_CASE("output source codes")
{
    for (int code = 1; code <= 7; ++code) {
        auto values = healthyValues();
        values[SentryTemplates::OUTPUT_SOURCE] = std::to_string(code);
        values[SentryTemplates::OUTPUT_NUM_LINES] = "1";
        addOutputLine(values, 1, 2300, 10, 230, 20);

        ModuleHarness h(values);
        OutputModule output;
        h.run(output);

        INFO("source " << code);
        const std::string fragment = "output " + SentryTemplates::outputSourceName(code) + " (20%)";
        if (code == SentryTemplates::OUTPUT_SOURCE_NORMAL) {
            CHECK(h.report.level() == Severity::OK);
            CHECK(h.fragments(Severity::OK) == std::vector<std::string>{ fragment });
        } else {
            CHECK(h.report.level() == Severity::CRITICAL);
            CHECK(h.fragments(Severity::CRITICAL) == std::vector<std::string>{ fragment });
        }
    }

    auto values = healthyValues();
    values[SentryTemplates::OUTPUT_SOURCE] = "8";
    ModuleHarness h(values);
    OutputModule output;
    CHECK_THROWS_AS(h.run(output), DataError);
}

TEST_CASE("output load thresholds")
{
    auto values = healthyValues();
    values[SentryTemplates::OUTPUT_NUM_LINES] = "3";
    addOutputLine(values, 1, 2300, 10, 230, 50);
    addOutputLine(values, 2, 2300, 40, 920, 85);
    addOutputLine(values, 3, 2300, 45, 1035, 95);

    SECTION("without thresholds load has no severity effect")
    {
        ModuleHarness h(values);
        OutputModule output;
        h.run(output);

        CHECK(h.report.level() == Severity::OK);
        CHECK(h.fragments(Severity::OK) == std::vector<std::string>{ "output normal (95%)" });
        CHECK(h.metric("output3_load")->warning.empty());
        CHECK(h.metric("output3_load")->max == 100.0);
    }

    SECTION("one threshold pair applies to every line")
    {
        ModuleHarness h(values);
        h.settings.loadThresholds = parseThresholdList("80", "90");
        OutputModule output;
        h.run(output);

        CHECK(h.report.level() == Severity::CRITICAL);
        CHECK(h.report.render("head") ==
              "output line 3 load 95%, WARNING: output line 2 load 85%, OK: output normal (95%)");
        CHECK(h.metric("output1_load")->warning == "80");
        CHECK(h.metric("output1_load")->critical == "90");
    }

    SECTION("one threshold pair per line")
    {
        ModuleHarness h(values);
        h.settings.loadThresholds = parseThresholdList("40,90,96", "60,95,99");
        OutputModule output;
        h.run(output);

        CHECK(h.fragments(Severity::WARNING) == std::vector<std::string>{ "output line 1 load 50%" });
        CHECK(h.fragments(Severity::CRITICAL).empty());
        CHECK(h.metric("output2_load")->critical == "95");
    }

    SECTION("warnings after a critical are dropped")
    {
        ModuleHarness h(values);
        h.report.critical("battery low (10%; 3min)");
        h.settings.loadThresholds = parseThresholdList("80", "");
        OutputModule output;
        h.run(output);

        CHECK(h.fragments(Severity::WARNING).empty());
        CHECK(h.metric("output2_load")->warning == "80");
    }
}

TEST_CASE("alarm display collapses equal activation times")
{
    auto entry = [](const std::string& name, uint64_t since) {
        AlarmEntry e;
        e.oid = name;
        e.name = name;
        e.since = since;
        return e;
    };

    CHECK(AlarmModule::displayNames({ entry("a", 100) }, 6100) == std::vector<std::string>{ "a(60s)" });
    CHECK(AlarmModule::displayNames({ entry("a", 100), entry("b", 100), entry("c", 100) }, 6100) ==
          std::vector<std::string>{ "a", "b", "c(60s)" });
    CHECK(AlarmModule::displayNames({ entry("a", 100), entry("b", 200), entry("c", 200) }, 60100) ==
          std::vector<std::string>{ "a(1min)", "b", "c(599s)" });

    // Jövőbeli időbélyeg: nulla eltelt idő
    CHECK(AlarmModule::displayNames({ entry("a", 9000) }, 100) == std::vector<std::string>{ "a(0s)" });
}

TEST_CASE("alarm section")
{
    const std::string onBattery = SentryTemplates::alarmOid(2);
    const std::string lowBattery = SentryTemplates::alarmOid(3);

    auto values = healthyValues();
    values[SentryTemplates::SYS_UPTIME] = "1000000";
    values[SentryTemplates::ALARMS_PRESENT] = "3";
    addAlarm(values, 1, onBattery, 994000);
    addAlarm(values, 2, lowBattery, 994000);
    addAlarm(values, 3, "1.3.6.1.4.1.534.1.7.1", 400000);

    SECTION("active alarms are critical")
    {
        ModuleHarness h(values);
        AlarmModule alarms;
        h.run(alarms);

        CHECK(h.report.level() == Severity::CRITICAL);
        CHECK(h.fragments(Severity::CRITICAL) ==
              std::vector<std::string>{ "alarms: OnBattery, LowBattery(60s), 1.3.6.1.4.1.534.1.7.1(2h)" });
        CHECK(h.metric("alarms")->value == 3);
        CHECK(h.metric("alarms")->unit == "c");
    }

    SECTION("ignored alarms are counted")
    {
        ModuleHarness h(values);
        h.settings.ignoredAlarms.addList("2,1.3.6.1.4.1.534.1.7.1");
        AlarmModule alarms;
        h.run(alarms);

        CHECK(h.fragments(Severity::CRITICAL) ==
              std::vector<std::string>{ "alarms: LowBattery(60s)", "2 alarms ignored" });
    }

    SECTION("only ignored alarms")
    {
        ModuleHarness h(values);
        h.settings.ignoredAlarms.addList("OnBattery,LowBattery,1.3.6.1.4.1.534.1.7.1");
        AlarmModule alarms;
        h.run(alarms);

        CHECK(h.report.level() == Severity::OK);
        CHECK(h.fragments(Severity::OK) == std::vector<std::string>{ "3 alarms ignored" });
    }

    SECTION("no alarms")
    {
        ModuleHarness h(healthyValues());
        AlarmModule alarms;
        h.run(alarms);

        CHECK(h.fragments(Severity::OK) == std::vector<std::string>{ "no alarms" });
        CHECK(h.metric("alarms")->value == 0);
    }

    SECTION("alarm rows are mandatory")
    {
        values.erase(SentryTemplates::tableCell(SentryTemplates::ALARM_ENTRY, SentryTemplates::ALARM_COL_TIME, 3));
        ModuleHarness h(values);
        AlarmModule alarms;
        CHECK_THROWS_WITH(h.run(alarms), Catch::Contains("alarm 3 time"));
    }
}

TEST_CASE("self-test dispatch")
{
    struct {
        int summary;
        bool suppressed;
        Severity level;
        std::vector<std::string> fragments;
    } testVector[] = {
        { 1, false, Severity::OK, { "test passed: QuickBatteryTest" } },
        { 2, false, Severity::WARNING, { "test warning: QuickBatteryTest" } },
        { 3, false, Severity::CRITICAL, { "test failed: QuickBatteryTest" } },
        { 4, false, Severity::WARNING, { "test aborted: QuickBatteryTest" } },
        { 5, false, Severity::OK, { "test running: QuickBatteryTest (60s)" } },
        { 6, false, Severity::OK, { "no test" } },
        { 9, false, Severity::OK, {} },
        { 1, true, Severity::OK, { "test passed: QuickBatteryTest" } },
        { 2, true, Severity::OK, {} },
        { 3, true, Severity::OK, {} },
        { 4, true, Severity::OK, {} },
        { 6, true, Severity::OK, { "no test" } },
    };

    for (auto& it : testVector) {
        auto values = healthyValues();
        values[SentryTemplates::TEST_ID] = SentryTemplates::TEST_IDS + ".4";
        values[SentryTemplates::TEST_RESULTS_SUMMARY] = std::to_string(it.summary);
        values[SentryTemplates::TEST_START_TIME] = "4000";

        ModuleHarness h(values);
        h.uptime = 10000;
        h.settings.suppressTestResults = it.suppressed;
        SelfTestModule selfTest;
        h.run(selfTest);

        INFO("summary " << it.summary << (it.suppressed ? " (suppressed)" : ""));
        CHECK(h.report.level() == it.level);

        std::vector<std::string> all;
        for (auto severity : { Severity::CRITICAL, Severity::WARNING, Severity::OK }) {
            for (const auto& fragment : h.fragments(severity)) all.push_back(fragment);
        }
        CHECK(all == it.fragments);
    }
}

TEST_CASE("no test initiated wins over the summary")
{
    auto values = healthyValues();
    values[SentryTemplates::TEST_ID] = "." + SentryTemplates::TEST_IDS + ".1";
    values[SentryTemplates::TEST_RESULTS_SUMMARY] = "3";

    ModuleHarness h(values);
    SelfTestModule selfTest;
    h.run(selfTest);

    CHECK(h.report.level() == Severity::OK);
    CHECK(h.fragments(Severity::OK) == std::vector<std::string>{ "no test" });
}
