#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>

#include "util/constants.hpp"

namespace app
{

enum class Direction
{
    Stop,
    Left,
    Right
};

const char *direction_name(Direction d);

// Two raw magnitudes from the sensor characteristic: s1 drives RIGHT, s2 drives LEFT.
struct SensorFrame
{
    std::uint8_t s1{0};
    std::uint8_t s2{0};
};

// First two bytes of a notification value; nullopt when fewer than two bytes.
std::optional<SensorFrame> frame_from_bytes(const std::uint8_t *data, std::size_t len);

// Next direction from (frame, prev). Total and side-effect free.
//   1. both over threshold and prev LEFT, or only s2 over   -> LEFT
//   2. both over threshold and prev RIGHT, or only s1 over  -> RIGHT
//   3. neither over threshold                                -> STOP
//   4. both over threshold and prev STOP                     -> prev (no rule fires)
Direction classify(const SensorFrame &f, Direction prev,
                   std::uint8_t threshold = constants::SENSOR_THRESHOLD);

// Stateful wrapper holding the previous direction between frames.
class SignalClassifier
{
  public:
    explicit SignalClassifier(std::uint8_t threshold = constants::SENSOR_THRESHOLD,
                              Direction    initial   = Direction::Stop)
        : threshold_(threshold), state_(initial)
    {
    }

    Direction feed(const SensorFrame &f);
    Direction state() const { return state_; }
    void      reset(Direction d = Direction::Stop) { state_ = d; }
    std::uint8_t threshold() const { return threshold_; }

  private:
    std::uint8_t threshold_;
    Direction    state_;
};

}  // namespace app
