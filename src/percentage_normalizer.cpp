#include "percentage_normalizer.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

std::vector<int64_t> PercentageNormalizer::normalizeTenths(const std::vector<uint64_t>& values,
                                                           uint64_t total) {
    const size_t n = values.size();
    std::vector<int64_t> tenths(n, 0);
    if (n == 0 || total == 0) {
        return tenths;
    }

    // Signed distance between the exact value and its rounded tenths
    std::vector<double> remainders(n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        const double exact = static_cast<double>(values[i]) * 1000.0 / static_cast<double>(total);
        tenths[i] = std::llround(exact);
        remainders[i] = exact - static_cast<double>(tenths[i]);
    }

    int64_t deficit = 1000 - std::accumulate(tenths.begin(), tenths.end(), int64_t{0});
    if (deficit == 0) {
        return tenths;
    }

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    if (deficit > 0) {
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            return remainders[a] > remainders[b];
        });
    } else {
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            return remainders[a] < remainders[b];
        });
    }

    const int64_t step = deficit > 0 ? 1 : -1;
    // Shares never go below zero; an overshoot always leaves a positive entry
    for (size_t k = 0; deficit != 0; k = (k + 1) % n) {
        if (step < 0 && tenths[order[k]] == 0) {
            continue;
        }
        tenths[order[k]] += step;
        deficit -= step;
    }
    return tenths;
}

std::vector<double> PercentageNormalizer::normalize(const std::vector<uint64_t>& values, uint64_t total) {
    const auto tenths = normalizeTenths(values, total);
    std::vector<double> percents;
    percents.reserve(tenths.size());
    for (const int64_t t : tenths) {
        percents.push_back(static_cast<double>(t) / 10.0);
    }
    return percents;
}
