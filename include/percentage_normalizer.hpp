#pragma once

#include <cstdint>
#include <vector>

// Turns integer magnitudes into one-decimal percentages that add up to
// exactly 100.0 using the largest remainder method.
class PercentageNormalizer {
public:
    // values[i] / total as percentages. All zeros when total is 0, empty
    // when values is empty. Ties between equal remainders go to the lower
    // index first. `total` is normally the sum of `values`; when the values
    // add up to more, the shares are scaled down without going negative.
    static std::vector<double> normalize(const std::vector<uint64_t>& values, uint64_t total);

    // Same as normalize() but in integer tenths of a percent (sum 1000)
    static std::vector<int64_t> normalizeTenths(const std::vector<uint64_t>& values, uint64_t total);
};
