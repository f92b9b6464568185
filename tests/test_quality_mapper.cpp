#include <catch2/catch_test_macros.hpp>

#include "quality_mapper.hpp"

using namespace audiobatch;

TEST_CASE("quality_mapper_thresholds")
{
    REQUIRE(map_quality(100) == 0);
    REQUIRE(map_quality(90) == 0);
    REQUIRE(map_quality(89) == 2);
    REQUIRE(map_quality(75) == 2);
    REQUIRE(map_quality(74) == 3);
    REQUIRE(map_quality(60) == 3);
    REQUIRE(map_quality(59) == 4);
    REQUIRE(map_quality(50) == 4);
    REQUIRE(map_quality(49) == 5);
    REQUIRE(map_quality(40) == 5);
    REQUIRE(map_quality(39) == 6);
    REQUIRE(map_quality(30) == 6);
}

TEST_CASE("quality_mapper_is_monotonic")
{
    for (int p = kMinQualityPercent; p < kMaxQualityPercent; ++p)
    {
        REQUIRE(map_quality(p + 1) <= map_quality(p));
    }
    STATIC_REQUIRE(map_quality(kDefaultQualityPercent) == 3);
}

TEST_CASE("quality_percent_range")
{
    REQUIRE(is_valid_quality_percent(30));
    REQUIRE(is_valid_quality_percent(100));
    REQUIRE_FALSE(is_valid_quality_percent(29));
    REQUIRE_FALSE(is_valid_quality_percent(101));
}
