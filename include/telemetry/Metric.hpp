#pragma once

#include <optional>
#include <string>

namespace Sentry::Core {

// Egy teljesítményadat (perfdata) bejegyzés. Létrehozás után nem módosul.
struct Metric {
    std::string label;
    double value = 0.0;
    std::string unit;

    std::optional<double> min = 0.0;
    std::optional<double> max;

    // Küszöb-leírók a riportoló számára (range szöveg, üres ha nincs)
    std::string warning;
    std::string critical;
};

inline Metric makeMetric(const std::string& label, double value, const std::string& unit = "") {
    Metric m;
    m.label = label;
    m.value = value;
    m.unit = unit;
    return m;
}

inline Metric makeBoundedMetric(const std::string& label, double value, const std::string& unit,
                                double min, double max) {
    Metric m = makeMetric(label, value, unit);
    m.min = min;
    m.max = max;
    return m;
}

// Előjeles mennyiségek (áram, hőmérséklet): nincs deklarált minimum
inline Metric makeSignedMetric(const std::string& label, double value, const std::string& unit) {
    Metric m = makeMetric(label, value, unit);
    m.min.reset();
    return m;
}

// Monoton számláló, egység "c"
inline Metric makeCounter(const std::string& label, double value) {
    return makeMetric(label, value, "c");
}

}
