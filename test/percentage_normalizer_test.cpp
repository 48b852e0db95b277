#include <catch2/catch_test_macros.hpp>
#include "percentage_normalizer.hpp"
#include <numeric>

TEST_CASE("PercentageNormalizer sums to exactly 100", "[PercentageNormalizer]") {
    SECTION("Equal thirds give the extra tenth to the first entry") {
        REQUIRE(PercentageNormalizer::normalizeTenths({1, 1, 1}, 3) == std::vector<int64_t>{334, 333, 333});
        REQUIRE(PercentageNormalizer::normalize({1, 1, 1}, 3) == std::vector<double>{33.4, 33.3, 33.3});
    }

    SECTION("Empty input") {
        REQUIRE(PercentageNormalizer::normalize({}, 0).empty());
    }

    SECTION("Zero total gives zeros") {
        REQUIRE(PercentageNormalizer::normalize({0, 0}, 0) == std::vector<double>{0.0, 0.0});
    }

    SECTION("Overshoot is taken from the smallest remainders") {
        // 166.67 rounds up six times, two tenths too many
        REQUIRE(PercentageNormalizer::normalizeTenths({1, 1, 1, 1, 1, 1}, 6) ==
                std::vector<int64_t>{166, 166, 167, 167, 167, 167});
    }

    SECTION("Exact values are left alone") {
        REQUIRE(PercentageNormalizer::normalizeTenths({7, 13, 29, 51}, 100) ==
                std::vector<int64_t>{70, 130, 290, 510});
    }

    SECTION("Remainders decide which entries move") {
        // 111.11 each rounds to 999
        REQUIRE(PercentageNormalizer::normalizeTenths({1, 1, 1, 1, 1, 1, 1, 1, 1}, 9) ==
                std::vector<int64_t>{112, 111, 111, 111, 111, 111, 111, 111, 111});
        // 42.857 twice and 14.286 round to 1001; a 42.9 entry gives one back
        REQUIRE(PercentageNormalizer::normalizeTenths({3, 3, 1}, 7) == std::vector<int64_t>{428, 429, 143});
        // 142.86 each rounds to 1001
        REQUIRE(PercentageNormalizer::normalizeTenths({1, 1, 1, 1, 1, 1, 1}, 7) ==
                std::vector<int64_t>{142, 143, 143, 143, 143, 143, 143});
    }

    SECTION("Values larger than the total never go negative") {
        REQUIRE(PercentageNormalizer::normalize({0, 10}, 5) == std::vector<double>{0.0, 100.0});

        const auto tenths = PercentageNormalizer::normalizeTenths({7, 9}, 5);
        REQUIRE(tenths == std::vector<int64_t>{300, 700});
        REQUIRE(std::accumulate(tenths.begin(), tenths.end(), int64_t{0}) == 1000);
    }

    SECTION("Arbitrary magnitudes") {
        const std::vector<uint64_t> values = {18848, 5012, 2391, 977, 311, 42, 7};
        const uint64_t total = std::accumulate(values.begin(), values.end(), uint64_t{0});
        const auto tenths = PercentageNormalizer::normalizeTenths(values, total);
        REQUIRE(tenths.size() == values.size());
        REQUIRE(std::accumulate(tenths.begin(), tenths.end(), int64_t{0}) == 1000);
    }
}
