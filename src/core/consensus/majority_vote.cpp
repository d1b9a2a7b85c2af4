#include "core/consensus/majority_vote.h"

#include <cmath>

namespace vmc {

double roundTo2(double value)
{
    return std::round(value * 100.0) / 100.0;
}

std::optional<double> scopedAverage(const std::vector<int>& values,
                                    const std::vector<QString>& categories,
                                    const QString& referenceCategory)
{
    if (values.size() != categories.size()) {
        return std::nullopt;
    }

    double sum = 0.0;
    int count = 0;
    for (size_t i = 0; i < values.size(); ++i) {
        if (categories[i] == referenceCategory) {
            sum += values[i];
            ++count;
        }
    }
    if (count == 0) {
        return std::nullopt;
    }
    return sum / count;
}

} // namespace vmc
