#pragma once

#include <QString>

#include <optional>
#include <utility>
#include <vector>

namespace vmc {

// Consensus of one coded field across the raters of one utterance.
template <typename T>
struct FieldConsensus {
    std::optional<T> consensus;
    // Fraction of raters matching the consensus, rounded to two decimals;
    // 0.0 when there is no consensus.
    double agreement = 0.0;
};

double roundTo2(double value);

// Majority vote over exactly raterCount values. The most frequent value is
// the consensus only when it holds a strict majority (more than half);
// otherwise there is no consensus. Returns nullopt when raterCount < 1 or
// the number of values differs from raterCount.
template <typename T>
std::optional<FieldConsensus<T>> plurality(const std::vector<T>& values, int raterCount)
{
    if (raterCount < 1 || values.size() != static_cast<size_t>(raterCount)) {
        return std::nullopt;
    }

    std::vector<std::pair<T, int>> groups;
    for (const T& value : values) {
        bool found = false;
        for (auto& group : groups) {
            if (group.first == value) {
                ++group.second;
                found = true;
                break;
            }
        }
        if (!found) {
            groups.emplace_back(value, 1);
        }
    }

    const std::pair<T, int>* largest = nullptr;
    for (const auto& group : groups) {
        if (!largest || group.second > largest->second) {
            largest = &group;
        }
    }

    FieldConsensus<T> result;
    if (largest && largest->second * 2 > raterCount) {
        result.consensus = largest->first;
        result.agreement = roundTo2(static_cast<double>(largest->second) / raterCount);
    }
    return result;
}

// Mean of the values whose category equals referenceCategory. nullopt when
// none qualify or the two lists differ in length.
std::optional<double> scopedAverage(const std::vector<int>& values,
                                    const std::vector<QString>& categories,
                                    const QString& referenceCategory);

} // namespace vmc
