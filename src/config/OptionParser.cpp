// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#include "config/ProbeOptions.hpp"
#include "core/Errors.hpp"
#include "core/FieldAccessor.hpp"
#include "core/Threshold.hpp"
#include "utils/StringUtils.hpp"

#include <optional>
#include <sstream>

namespace Sentry::Config {

    using Sentry::Core::ConfigError;

    namespace {
        struct OptionSpec {
            char shortName;
            const char* longName;
            bool takesValue;
        };

        // 0 short name: csak hosszú alak létezik
        const std::vector<OptionSpec> OPTIONS = {
            { 'H', "hostname",         true  },
            { 'p', "port",             true  },
            { 'P', "protocol",         true  },
            { 'C', "community",        true  },
            { 'U', "username",         true  },
            { 'a', "authprotocol",     true  },
            { 'A', "authpassword",     true  },
            { 'x', "privprotocol",     true  },
            { 'X', "privpassword",     true  },
            { 't', "timeout",          true  },
            { 'v', "verbose",          false },
            { 0,   "disable-perfdata", false },
            { 'i', "ignore-alarms",    true  },
            { 0,   "no-test-warnings", false },
            { 'w', "warning",          true  },
            { 'c', "critical",         true  },
            { 'h', "help",             false },
            { 'V', "version",          false },
        };

        const OptionSpec* findShort(char c) {
            for (const auto& spec : OPTIONS) {
                if (spec.shortName != 0 && spec.shortName == c) return &spec;
            }
            return nullptr;
        }

        const OptionSpec* findLong(const std::string& name) {
            for (const auto& spec : OPTIONS) {
                if (name == spec.longName) return &spec;
            }
            return nullptr;
        }

        unsigned parseBounded(const std::string& value, int64_t min, int64_t max, const std::string& what) {
            auto parsed = Sentry::Core::parseCode(value, min, max);
            if (!parsed.ok()) {
                throw ConfigError("invalid " + what + ": " + parsed.reason);
            }
            return static_cast<unsigned>(*parsed.value);
        }

        std::string oneOf(const std::string& value, const std::vector<std::string>& allowed, const std::string& what) {
            for (const auto& candidate : allowed) {
                if (SentryUtils::toLower(value) == SentryUtils::toLower(candidate)) return candidate;
            }
            throw ConfigError("invalid " + what + " '" + value + "' (expected "
                              + SentryUtils::join(allowed, " or ") + ")");
        }

        // A nyers értékek, amelyeket csak a teljes argv után lehet értelmezni
        struct PendingValues {
            std::string warningCsv;
            std::string criticalCsv;
            std::vector<std::string> ignoreLists;
        };

        void apply(const OptionSpec& spec, const std::string& value, ProbeOptions& options, PendingValues& pending) {
            auto& snmp = options.snmp;
            const std::string name = spec.longName;

            if (name == "hostname") {
                snmp.hostname = value;
            } else if (name == "port") {
                snmp.port = parseBounded(value, 1, 65535, "port");
            } else if (name == "protocol") {
                std::string protocol = oneOf(value, {"1", "2", "2c", "3"}, "protocol version");
                if (protocol == "1") snmp.version = Sentry::Core::SnmpVersion::V1;
                else if (protocol == "3") snmp.version = Sentry::Core::SnmpVersion::V3;
                else snmp.version = Sentry::Core::SnmpVersion::V2C;
            } else if (name == "community") {
                snmp.community = value;
            } else if (name == "username") {
                snmp.username = value;
            } else if (name == "authprotocol") {
                snmp.authProtocol = oneOf(value, {"MD5", "SHA"}, "authentication protocol");
            } else if (name == "authpassword") {
                snmp.authPassword = value;
            } else if (name == "privprotocol") {
                snmp.privProtocol = oneOf(value, {"DES", "AES"}, "privacy protocol");
            } else if (name == "privpassword") {
                snmp.privPassword = value;
            } else if (name == "timeout") {
                snmp.timeoutSeconds = parseBounded(value, 1, 3600, "timeout");
            } else if (name == "verbose") {
                ++options.verbosity;
            } else if (name == "disable-perfdata") {
                options.perfData = false;
            } else if (name == "ignore-alarms") {
                pending.ignoreLists.push_back(value);
            } else if (name == "no-test-warnings") {
                options.evaluation.suppressTestResults = true;
            } else if (name == "warning") {
                pending.warningCsv = value;
            } else if (name == "critical") {
                pending.criticalCsv = value;
            } else if (name == "help") {
                options.showHelp = true;
            } else if (name == "version") {
                options.showVersion = true;
            }
        }
    }

    ProbeOptions parseOptions(const std::vector<std::string>& args) {
        ProbeOptions options;
        PendingValues pending;

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            auto nextValue = [&](const std::string& option) -> std::string {
                if (i + 1 >= args.size()) {
                    throw ConfigError("option " + option + " requires a value");
                }
                return args[++i];
            };

            if (arg == "--") {
                if (i + 1 < args.size()) {
                    throw ConfigError("surplus operand '" + args[i + 1] + "'");
                }
                break;
            }

            if (arg.rfind("--", 0) == 0) {
                std::string name = arg.substr(2);
                std::optional<std::string> inlineValue;
                size_t eq = name.find('=');
                if (eq != std::string::npos) {
                    inlineValue = name.substr(eq + 1);
                    name = name.substr(0, eq);
                }

                const OptionSpec* spec = findLong(name);
                if (spec == nullptr) {
                    throw ConfigError("unknown option '--" + name + "'");
                }
                if (!spec->takesValue && inlineValue) {
                    throw ConfigError("option --" + name + " does not take a value");
                }

                std::string value;
                if (spec->takesValue) {
                    value = inlineValue ? *inlineValue : nextValue("--" + name);
                }
                apply(*spec, value, options, pending);
                continue;
            }

            if (arg.size() > 1 && arg[0] == '-') {
                const OptionSpec* spec = findShort(arg[1]);
                if (spec == nullptr) {
                    throw ConfigError("unknown option '" + arg + "'");
                }

                if (spec->takesValue) {
                    std::string value = arg.size() > 2 ? arg.substr(2) : nextValue(arg);
                    apply(*spec, value, options, pending);
                    continue;
                }

                // Összevont kapcsolók, pl. -vv
                for (size_t k = 1; k < arg.size(); ++k) {
                    const OptionSpec* flag = findShort(arg[k]);
                    if (flag == nullptr || flag->takesValue) {
                        throw ConfigError("unknown option '-" + std::string(1, arg[k]) + "' in '" + arg + "'");
                    }
                    apply(*flag, "", options, pending);
                }
                continue;
            }

            throw ConfigError("surplus operand '" + arg + "'");
        }

        if (options.showHelp || options.showVersion) {
            return options;
        }

        if (options.snmp.hostname.empty()) {
            throw ConfigError("missing required option --hostname");
        }
        if (options.snmp.version == Sentry::Core::SnmpVersion::V3 && options.snmp.username.empty()) {
            throw ConfigError("SNMPv3 requires --username");
        }
        if (!options.snmp.privPassword.empty() && options.snmp.authPassword.empty()) {
            throw ConfigError("--privpassword requires --authpassword");
        }

        for (const auto& list : pending.ignoreLists) {
            options.evaluation.ignoredAlarms.addList(list);
        }
        options.evaluation.loadThresholds =
            Sentry::Core::parseThresholdList(pending.warningCsv, pending.criticalCsv);

        return options;
    }

    std::string usage(const std::string& program) {
        std::ostringstream oss;
        oss << "Usage: " << program << " -H <host> [options]\n"
            << "\n"
            << "Connection:\n"
            << "  -H, --hostname=HOST        UPS address (required)\n"
            << "  -p, --port=PORT            SNMP port (default 161)\n"
            << "  -P, --protocol=1|2c|3      SNMP version (default 2c)\n"
            << "  -C, --community=STRING     community for v1/v2c (default public)\n"
            << "  -U, --username=USER        SNMPv3 security name\n"
            << "  -a, --authprotocol=MD5|SHA SNMPv3 authentication protocol\n"
            << "  -A, --authpassword=PASS    SNMPv3 authentication password\n"
            << "  -x, --privprotocol=DES|AES SNMPv3 privacy protocol\n"
            << "  -X, --privpassword=PASS    SNMPv3 privacy password\n"
            << "  -t, --timeout=SECONDS      request timeout (default 15)\n"
            << "\n"
            << "Evaluation:\n"
            << "  -w, --warning=RANGE[,...]  output load warning range(s), one or one per line\n"
            << "  -c, --critical=RANGE[,...] output load critical range(s), one or one per line\n"
            << "  -i, --ignore-alarms=LIST   alarms to ignore: names, 1..24 or dotted OIDs\n"
            << "      --no-test-warnings     do not report failed or aborted self-tests\n"
            << "      --disable-perfdata     omit performance data\n"
            << "\n"
            << "  -v, --verbose              diagnostics on stderr (repeat for more)\n"
            << "  -h, --help                 show this help\n"
            << "  -V, --version              show version\n";
        return oss.str();
    }
}
