#include <algorithm>
#include <cmath>
#include <numeric>

#include <gtest/gtest.h>

#include "errors.hpp"
#include "rayleigh.hpp"

using namespace raydef;

TEST(Rayleigh, LengthsFollowHorizon)
{
    for (double d : {1.0, 2.0, 3.3, 6.0, 10.0, 12.5, 24.0}) {
        MonthlyCurve c = distribute(100, d);
        const std::size_t h = static_cast<std::size_t>(std::floor(d * 1.5));
        ASSERT_EQ(c.distribution.size(), h) << "duration " << d;
        ASSERT_EQ(c.months.size(), h) << "duration " << d;
        for (std::size_t i = 0; i < h; ++i)
            EXPECT_EQ(c.months[i], static_cast<int>(i + 1));
    }
}

TEST(Rayleigh, WorkedExample)
{
    /* duration 10 → σ = 4, horizon 15 */
    MonthlyCurve c = distribute(100, 10.0);
    ASSERT_EQ(c.months.size(), 15u);
    EXPECT_NEAR(rayleigh_pdf(1.0, 4.0), 0.0605, 1e-3);
    EXPECT_NEAR(rayleigh_pdf(1.0, 4.0), (1.0 / 16.0) * std::exp(-1.0 / 32.0), 1e-15);
    EXPECT_DOUBLE_EQ(c.distribution[0], 6.06);   // 6.0577… to 2 decimals
    /* mode of the curve sits at t = σ */
    auto peak = std::max_element(c.distribution.begin(), c.distribution.end());
    EXPECT_EQ(c.months[peak - c.distribution.begin()], 4);
}

TEST(Rayleigh, ValuesHaveTwoDecimals)
{
    MonthlyCurve c = distribute(137, 7.0);
    for (double v : c.distribution)
        EXPECT_NEAR(v * 100.0, std::round(v * 100.0), 1e-6);
}

TEST(Rayleigh, ZeroTotalGivesZeros)
{
    MonthlyCurve c = distribute(0, 8.0);
    ASSERT_EQ(c.distribution.size(), 12u);
    for (double v : c.distribution) EXPECT_EQ(v, 0.0);
}

TEST(Rayleigh, ShortDurationGivesEmptyCurve)
{
    MonthlyCurve c = distribute(50, 0.5);   // ⌊0.75⌋ = 0
    EXPECT_TRUE(c.distribution.empty());
    EXPECT_TRUE(c.months.empty());
}

TEST(Rayleigh, RejectsNonPositiveDuration)
{
    EXPECT_THROW(distribute(10, 0.0),  InvalidDuration);
    EXPECT_THROW(distribute(10, -3.0), InvalidDuration);
    EXPECT_THROW(distribute(10, std::nan("")), InvalidDuration);
    EXPECT_THROW(distribute(10, INFINITY), InvalidDuration);
    EXPECT_THROW(rayleigh_pdf(1.0, 0.0), InvalidDuration);
}

TEST(Rayleigh, RejectsHugeHorizonAndNegativeTotal)
{
    EXPECT_THROW(distribute(10, 1e9), InvalidDuration);
    EXPECT_NO_THROW(distribute(10, MAX_HORIZON / HORIZON_FACTOR));
    EXPECT_THROW(distribute(-1, 10.0), InvalidInput);
}

TEST(Rayleigh, TruncatedSumIsNotRenormalised)
{
    /* most of the mass falls inside 1.5·duration, but not all of it */
    MonthlyCurve c = distribute(1000, 10.0);
    const double sum = std::accumulate(c.distribution.begin(), c.distribution.end(), 0.0);
    EXPECT_GT(sum, 900.0);
    EXPECT_LT(sum, 1000.0);
}
