// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#include "modules/SelfTestModule.hpp"
#include "utils/StringUtils.hpp"
#include "utils/UpsMibTemplates.hpp"

namespace Sentry::Modules {

    using namespace SentryTemplates;

    void SelfTestModule::run(EvaluationContext& ctx) {
        const auto& f = ctx.fields;

        std::string testId = f.objectId(TEST_ID, "self-test identifier");
        int64_t summary = f.integer(TEST_RESULTS_SUMMARY, "self-test result summary");
        uint64_t startTime = f.unsignedValue(TEST_START_TIME, "self-test start time");

        const std::string name = testName(testId);
        const auto result = static_cast<TestResult>(summary);

        if (result == TestResult::NO_TESTS_INITIATED || isNoTestsInitiated(testId)) {
            ctx.report.ok("no test");
            return;
        }
        if (result == TestResult::IN_PROGRESS) {
            uint64_t elapsed = ctx.uptime > startTime ? ctx.uptime - startTime : 0;
            ctx.report.ok("test running: " + name + " (" + SentryUtils::formatDuration(elapsed) + ")");
            return;
        }
        if (result == TestResult::PASSED) {
            ctx.report.ok("test passed: " + name);
            return;
        }

        if (ctx.settings.suppressTestResults) return;

        switch (result) {
            case TestResult::WARNING:
                ctx.report.warning("test warning: " + name);
                break;
            case TestResult::ERROR:
                ctx.report.critical("test failed: " + name);
                break;
            case TestResult::ABORTED:
                ctx.report.warning("test aborted: " + name);
                break;
            default:
                // Ismeretlen összegző kód: nincs töredék
                break;
        }
    }
}
