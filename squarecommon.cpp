#include "squarecommon.h"
#include <algorithm>
#include <cmath>


namespace SquareUtils {

bool isDefined(double value) {
    return !std::isnan(value);
}

double roundTo(double value, int decimals) {
    if (!std::isfinite(value)) {
        return value;
    }
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

double median(std::vector<double> values) {
    values.erase(std::remove_if(values.begin(), values.end(),
                                [](double v) { return std::isnan(v); }),
                 values.end());
    if (values.empty()) {
        return SquareConstants::UNDEFINED;
    }
    std::sort(values.begin(), values.end());
    const size_t mid = values.size() / 2;
    if (values.size() % 2 == 1) {
        return values[mid];
    }
    return (values[mid - 1] + values[mid]) / 2.0;
}

double maximum(const std::vector<double>& values) {
    double result = SquareConstants::UNDEFINED;
    for (double v : values) {
        if (std::isnan(v)) continue;
        if (std::isnan(result) || v > result) {
            result = v;
        }
    }
    return result;
}

double total(const std::vector<double>& values) {
    double sum = 0.0;
    bool any = false;
    for (double v : values) {
        if (std::isnan(v)) continue;
        sum += v;
        any = true;
    }
    return any ? sum : SquareConstants::UNDEFINED;
}

} // namespace SquareUtils
