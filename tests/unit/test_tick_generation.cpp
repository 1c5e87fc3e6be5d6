#include <gtest/gtest.h>
#include <limits>

#include "render/layout.hpp"

using namespace gigmap;

// ─── Generated ticks ────────────────────────────────────────────────────────

TEST(TickGeneration, UnitRangeStepsByTwo)
{
    auto ticks = generate_ticks(0.0, 10.0);
    EXPECT_EQ(ticks.positions, (std::vector<double>{0.0, 2.0, 4.0, 6.0, 8.0, 10.0}));
    EXPECT_EQ(ticks.labels, (std::vector<std::string>{"0", "2", "4", "6", "8", "10"}));
}

TEST(TickGeneration, FractionalSpacingKeepsDecimals)
{
    auto ticks = generate_ticks(0.0, 1.0);
    ASSERT_FALSE(ticks.positions.empty());
    EXPECT_EQ(ticks.labels.front(), "0");
    EXPECT_EQ(ticks.labels[1], "0.2");
}

TEST(TickGeneration, AllTicksInsideRange)
{
    auto ticks = generate_ticks(-3.7, 42.1);
    ASSERT_GE(ticks.positions.size(), 3u);
    EXPECT_EQ(ticks.positions.size(), ticks.labels.size());
    for (double v : ticks.positions)
    {
        EXPECT_GE(v, -3.7 - 1e-9);
        EXPECT_LE(v, 42.1 + 1e-9);
    }
}

TEST(TickGeneration, ZeroRangeGivesOneTick)
{
    auto ticks = generate_ticks(5.0, 5.0);
    ASSERT_EQ(ticks.positions.size(), 1u);
    EXPECT_DOUBLE_EQ(ticks.positions[0], 5.0);
}

TEST(TickGeneration, NonFiniteRangeGivesNothing)
{
    auto ticks = generate_ticks(0.0, std::numeric_limits<double>::infinity());
    EXPECT_TRUE(ticks.positions.empty());
}

TEST(TickGeneration, NoNegativeZeroLabel)
{
    auto ticks = generate_ticks(-1.0, 1.0);
    for (const auto& label : ticks.labels)
        EXPECT_NE(label, "-0");
}

// ─── Explicit ticks ─────────────────────────────────────────────────────────

TEST(AxisTicks, ExplicitTicksOutsideRangeAreDropped)
{
    AxisFormat fmt;
    fmt.tickvals = {0.0, 1.0, 2.0, 5.0};
    fmt.ticktext = {"a", "b", "c", "d"};

    auto ticks = axis_ticks(fmt, -0.5, 2.5);
    EXPECT_EQ(ticks.positions, (std::vector<double>{0.0, 1.0, 2.0}));
    EXPECT_EQ(ticks.labels, (std::vector<std::string>{"a", "b", "c"}));
}

TEST(AxisTicks, MissingTextFallsBackToValue)
{
    AxisFormat fmt;
    fmt.tickvals = {0.5, 1.5};
    fmt.ticktext = {"first"};

    auto ticks = axis_ticks(fmt, 0.0, 2.0);
    EXPECT_EQ(ticks.labels, (std::vector<std::string>{"first", "1.5"}));
}

TEST(AxisTicks, ReversedRangeStillMatches)
{
    AxisFormat fmt;
    fmt.tickvals = {1.0};
    auto ticks   = axis_ticks(fmt, 2.0, 0.0);
    EXPECT_EQ(ticks.positions.size(), 1u);
}

TEST(AxisTicks, GeneratedWhenNoTickvals)
{
    AxisFormat fmt;
    auto       ticks = axis_ticks(fmt, 0.0, 10.0);
    EXPECT_EQ(ticks.positions.size(), 6u);
}
