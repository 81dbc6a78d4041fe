#include <cstddef>
#include <cstdint>
#include <optional>

#include "app/signal_classifier.hpp"

namespace app
{

const char *direction_name(Direction d)
{
    switch (d)
    {
        case Direction::Stop:
            return "STOP";
        case Direction::Left:
            return "LEFT";
        case Direction::Right:
            return "RIGHT";
    }
    return "?";
}

std::optional<SensorFrame> frame_from_bytes(const std::uint8_t *data, std::size_t len)
{
    if (!data || len < 2)
        return std::nullopt;
    return SensorFrame{data[0], data[1]};
}

Direction classify(const SensorFrame &f, Direction prev, std::uint8_t threshold)
{
    const bool right = f.s1 > threshold;
    const bool left  = f.s2 > threshold;

    if ((right && left && prev == Direction::Left) || (!right && left))
        return Direction::Left;
    if ((right && left && prev == Direction::Right) || (right && !left))
        return Direction::Right;
    if (!right && !left)
        return Direction::Stop;
    // both active while stopped: keep the previous decision
    return prev;
}

Direction SignalClassifier::feed(const SensorFrame &f)
{
    state_ = classify(f, state_, threshold_);
    return state_;
}

}  // namespace app
