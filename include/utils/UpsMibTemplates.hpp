// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe
// UPS-MIB (RFC 1628) constants and domain tables

#ifndef SENTRY_UPS_MIB_TEMPLATES_HPP
#define SENTRY_UPS_MIB_TEMPLATES_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace SentryTemplates {

    // --- Probe-szintű állandók ---

    // Egy GET kérésben legfeljebb ennyi OID mehet (csomagméret-korlát)
    constexpr size_t MAX_OIDS_PER_REQUEST = 40;

    const std::string PLUGIN_NAME = "UPS";
    const std::string PROBE_VERSION = "1.4.0";
    const std::string UNIDENTIFIED_DEVICE = "unidentified UPS";

    // --- MIB-2 / UPS-MIB gyökerek ---
    const std::string SYS_UPTIME = "1.3.6.1.2.1.1.3.0";
    const std::string UPS_MIB = "1.3.6.1.2.1.33.1";

    // upsIdent
    const std::string IDENT_MANUFACTURER = UPS_MIB + ".1.1.0";
    const std::string IDENT_MODEL        = UPS_MIB + ".1.2.0";

    // upsBattery
    const std::string BATTERY_STATUS             = UPS_MIB + ".2.1.0";
    const std::string BATTERY_SECONDS_ON_BATTERY = UPS_MIB + ".2.2.0";
    const std::string BATTERY_MINUTES_REMAINING  = UPS_MIB + ".2.3.0";
    const std::string BATTERY_CHARGE_REMAINING   = UPS_MIB + ".2.4.0";
    const std::string BATTERY_VOLTAGE            = UPS_MIB + ".2.5.0";
    const std::string BATTERY_CURRENT            = UPS_MIB + ".2.6.0";
    const std::string BATTERY_TEMPERATURE        = UPS_MIB + ".2.7.0";

    // upsInput
    const std::string INPUT_LINE_BADS = UPS_MIB + ".3.1.0";
    const std::string INPUT_NUM_LINES = UPS_MIB + ".3.2.0";
    const std::string INPUT_ENTRY     = UPS_MIB + ".3.3.1";
    constexpr int INPUT_COL_FREQUENCY = 2;
    constexpr int INPUT_COL_VOLTAGE   = 3;
    constexpr int INPUT_COL_CURRENT   = 4;
    constexpr int INPUT_COL_POWER     = 5;

    // upsOutput
    const std::string OUTPUT_SOURCE    = UPS_MIB + ".4.1.0";
    const std::string OUTPUT_FREQUENCY = UPS_MIB + ".4.2.0";
    const std::string OUTPUT_NUM_LINES = UPS_MIB + ".4.3.0";
    const std::string OUTPUT_ENTRY     = UPS_MIB + ".4.4.1";
    constexpr int OUTPUT_COL_VOLTAGE = 2;
    constexpr int OUTPUT_COL_CURRENT = 3;
    constexpr int OUTPUT_COL_POWER   = 4;
    constexpr int OUTPUT_COL_LOAD    = 5;

    // upsBypass
    const std::string BYPASS_FREQUENCY = UPS_MIB + ".5.1.0";
    const std::string BYPASS_NUM_LINES = UPS_MIB + ".5.2.0";
    const std::string BYPASS_ENTRY     = UPS_MIB + ".5.3.1";
    constexpr int BYPASS_COL_VOLTAGE = 2;
    constexpr int BYPASS_COL_CURRENT = 3;
    constexpr int BYPASS_COL_POWER   = 4;

    // upsAlarm
    const std::string ALARMS_PRESENT     = UPS_MIB + ".6.1.0";
    const std::string ALARM_ENTRY        = UPS_MIB + ".6.2.1";
    const std::string WELL_KNOWN_ALARMS  = UPS_MIB + ".6.3";
    constexpr int ALARM_COL_DESCR = 2;
    constexpr int ALARM_COL_TIME  = 3;

    // upsTest
    const std::string TEST_ID              = UPS_MIB + ".7.1.0";
    const std::string TEST_RESULTS_SUMMARY = UPS_MIB + ".7.3.0";
    const std::string TEST_START_TIME      = UPS_MIB + ".7.5.0";
    const std::string TEST_IDS             = UPS_MIB + ".7.7";

    // --- Kód-tartományok ---
    constexpr int64_t BATTERY_STATUS_NORMAL = 2;
    constexpr int64_t OUTPUT_SOURCE_NORMAL  = 3;

    enum class TestResult : int64_t {
        PASSED = 1,
        WARNING = 2,
        ERROR = 3,
        ABORTED = 4,
        IN_PROGRESS = 5,
        NO_TESTS_INITIATED = 6
    };

    // upsBatteryStatus 1..4
    const std::vector<std::string> BATTERY_STATUS_NAMES = {
        "unknown", "normal", "low", "depleted"
    };

    // upsOutputSource 1..7
    const std::vector<std::string> OUTPUT_SOURCE_NAMES = {
        "other", "none", "normal", "bypass", "battery", "booster", "reducer"
    };

    // upsWellKnownAlarms 1..24
    const std::vector<std::string> ALARM_NAMES = {
        "BatteryBad", "OnBattery", "LowBattery", "DepletedBattery",
        "TempBad", "InputBad", "OutputBad", "OutputOverload",
        "OnBypass", "BypassBad", "OutputOffAsRequested", "UpsOffAsRequested",
        "ChargerFailed", "UpsOutputOff", "UpsSystemOff", "FanFailure",
        "FuseFailure", "GeneralFault", "DiagnosticTestFailed", "CommunicationsLost",
        "AwaitingPower", "ShutdownPending", "ShutdownImminent", "TestInProgress"
    };

    // upsTestId értékek 1..5
    const std::vector<std::string> TEST_NAMES = {
        "NoTestsInitiated", "AbortTestInProgress", "GeneralSystemsTest",
        "QuickBatteryTest", "DeepBatteryCalibration"
    };

    // --- Lookups ---

    std::string tableCell(const std::string& entry, int column, int64_t row);

    std::string batteryStatusName(int64_t code);
    std::string outputSourceName(int64_t code);

    std::string alarmOid(int index);
    std::optional<std::string> alarmOidByName(const std::string& name);

    /**
     * @brief Riasztás-azonosító feloldása névre; ismeretlen OID esetén maga az OID.
     */
    std::string alarmName(const std::string& oid);

    std::string testName(const std::string& oid);
    bool isNoTestsInitiated(const std::string& oid);
}

#endif
