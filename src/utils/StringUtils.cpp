// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#include "utils/StringUtils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace SentryUtils {

    namespace {
        uint64_t ceilDiv(uint64_t value, uint64_t divisor) {
            return (value + divisor - 1) / divisor;
        }
    }

    std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        size_t start = s.find_first_not_of(ws);
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(ws);
        return s.substr(start, end - start + 1);
    }

    std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::vector<std::string> split(const std::string& s, char delimiter) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (true) {
            size_t pos = s.find(delimiter, start);
            if (pos == std::string::npos) {
                parts.push_back(s.substr(start));
                break;
            }
            parts.push_back(s.substr(start, pos - start));
            start = pos + 1;
        }
        return parts;
    }

    std::string join(const std::vector<std::string>& parts, const std::string& separator) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) out += separator;
            out += parts[i];
        }
        return out;
    }

    std::string formatNumber(double value) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3) << value;
        std::string text = oss.str();

        // Záró nullák és a magányos tizedespont levágása
        text.erase(text.find_last_not_of('0') + 1);
        if (!text.empty() && text.back() == '.') text.pop_back();
        if (text == "-0") text = "0";
        return text;
    }

    std::string formatDuration(uint64_t centiseconds) {
        if (centiseconds < 60000) {
            return std::to_string(ceilDiv(centiseconds, 100)) + "s";
        }
        if (centiseconds < 360000) {
            return std::to_string(ceilDiv(centiseconds, 60000)) + "min";
        }
        if (centiseconds < 8640000) {
            return std::to_string(ceilDiv(centiseconds, 360000)) + "h";
        }
        return std::to_string(ceilDiv(centiseconds, 8640000)) + "d";
    }
}
