// © 2026 Beatrix Zselezny. All rights reserved.
// UPS-Sentry Monitoring Probe

#ifndef SENTRY_STRING_UTILS_HPP
#define SENTRY_STRING_UTILS_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace SentryUtils {
    /**
     * @brief Whitespace eltávolítása a szöveg elejéről és végéről.
     */
    std::string trim(const std::string& s);

    std::string toLower(std::string s);

    /**
     * @brief Szétvágás egy elválasztó mentén. Az üres darabok megmaradnak,
     * így a "5,,7" lista hibás elemét a hívó észreveszi.
     */
    std::vector<std::string> split(const std::string& s, char delimiter);

    std::string join(const std::vector<std::string>& parts, const std::string& separator);

    /**
     * @brief Számkiírás legfeljebb 3 tizedesjeggyel, a záró nullák nélkül (12.5, 230, -0.4).
     */
    std::string formatNumber(double value);

    /**
     * @brief TimeTicks (1/100 s) különbség sávos, felfelé kerekített kiírása.
     *
     * < 60000      -> ceil(t / 100)     "s"
     * < 360000     -> ceil(t / 60000)   "min"
     * < 8640000    -> ceil(t / 360000)  "h"
     * egyébként    -> ceil(t / 8640000) "d"
     */
    std::string formatDuration(uint64_t centiseconds);
}

#endif
