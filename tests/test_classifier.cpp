#include <cstdint>
#include <gtest/gtest.h>
#include <vector>

#include "app/signal_classifier.hpp"

using app::classify;
using app::Direction;
using app::SensorFrame;

namespace
{
// one frame per (right, left) activation at the default threshold (100)
SensorFrame frame_for(bool right, bool left)
{
    return SensorFrame{static_cast<std::uint8_t>(right ? 150 : 50),
                       static_cast<std::uint8_t>(left ? 150 : 50)};
}
}  // namespace

TEST(Classifier, RuleTableExhaustive)
{
    struct Row
    {
        bool      right, left;
        Direction prev, want;
    };
    const std::vector<Row> table = {
        // neither active -> STOP
        {false, false, Direction::Stop, Direction::Stop},
        {false, false, Direction::Left, Direction::Stop},
        {false, false, Direction::Right, Direction::Stop},
        // only left -> LEFT
        {false, true, Direction::Stop, Direction::Left},
        {false, true, Direction::Left, Direction::Left},
        {false, true, Direction::Right, Direction::Left},
        // only right -> RIGHT
        {true, false, Direction::Stop, Direction::Right},
        {true, false, Direction::Left, Direction::Right},
        {true, false, Direction::Right, Direction::Right},
        // both -> keep the previous direction
        {true, true, Direction::Stop, Direction::Stop},
        {true, true, Direction::Left, Direction::Left},
        {true, true, Direction::Right, Direction::Right},
    };

    for (const auto &r : table)
    {
        EXPECT_EQ(classify(frame_for(r.right, r.left), r.prev), r.want)
            << "right=" << r.right << " left=" << r.left
            << " prev=" << app::direction_name(r.prev);
    }
}

TEST(Classifier, ThresholdIsStrict)
{
    // exactly at threshold is not active
    EXPECT_EQ(classify({100, 100}, Direction::Left), Direction::Stop);
    EXPECT_EQ(classify({101, 100}, Direction::Stop), Direction::Right);
    EXPECT_EQ(classify({100, 101}, Direction::Stop), Direction::Left);
    EXPECT_EQ(classify({255, 0}, Direction::Left), Direction::Right);
}

TEST(Classifier, CustomThreshold)
{
    EXPECT_EQ(classify({20, 5}, Direction::Stop, 10), Direction::Right);
    EXPECT_EQ(classify({20, 5}, Direction::Stop, 30), Direction::Stop);
}

TEST(Classifier, IdleFramesConvergeToStop)
{
    for (Direction start : {Direction::Stop, Direction::Left, Direction::Right})
    {
        app::SignalClassifier c(100, start);
        for (int i = 0; i < 5; ++i)
            EXPECT_EQ(c.feed({50, 50}), Direction::Stop);
        EXPECT_EQ(c.state(), Direction::Stop);
    }
}

TEST(Classifier, BothActiveFromStopStaysStop)
{
    app::SignalClassifier c;
    EXPECT_EQ(c.feed({200, 200}), Direction::Stop);
    EXPECT_EQ(c.feed({200, 200}), Direction::Stop);
}

TEST(Classifier, RightRightStopSequence)
{
    app::SignalClassifier  c;
    std::vector<Direction> seen;
    seen.push_back(c.feed({150, 50}));
    seen.push_back(c.feed({150, 50}));
    seen.push_back(c.feed({50, 50}));
    EXPECT_EQ(seen, (std::vector<Direction>{Direction::Right, Direction::Right, Direction::Stop}));
}

TEST(Classifier, LeftOnlyFromRight)
{
    app::SignalClassifier c(100, Direction::Right);
    EXPECT_EQ(c.feed({50, 150}), Direction::Left);
}

TEST(Classifier, HoldsDirectionWhileBothActive)
{
    app::SignalClassifier c;
    EXPECT_EQ(c.feed({50, 150}), Direction::Left);
    EXPECT_EQ(c.feed({150, 150}), Direction::Left);
    EXPECT_EQ(c.feed({150, 50}), Direction::Right);
    EXPECT_EQ(c.feed({150, 150}), Direction::Right);
    c.reset();
    EXPECT_EQ(c.state(), Direction::Stop);
}

TEST(Classifier, FrameFromBytes)
{
    const std::uint8_t two[]   = {0x96, 0x32};
    const std::uint8_t three[] = {0x01, 0x02, 0xff};
    const std::uint8_t one[]   = {0x05};

    auto f = app::frame_from_bytes(two, sizeof(two));
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->s1, 150);
    EXPECT_EQ(f->s2, 50);

    auto g = app::frame_from_bytes(three, sizeof(three));
    ASSERT_TRUE(g.has_value());
    EXPECT_EQ(g->s1, 1);
    EXPECT_EQ(g->s2, 2);

    EXPECT_FALSE(app::frame_from_bytes(one, sizeof(one)).has_value());
    EXPECT_FALSE(app::frame_from_bytes(nullptr, 0).has_value());
}
