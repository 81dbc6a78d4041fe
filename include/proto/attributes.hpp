#pragma once
#include <cstddef>
#include <string>
#include <string_view>

/*
Known GATT identifiers of the sensor band.

Only SENSOR_UUID carries behaviour (it is the notify characteristic with the two
sensor magnitudes); every other entry is used for catalog display names and logs.
*/

namespace gatt
{

// Display name for a known service/characteristic UUID, else default_name.
// UUID match is case-insensitive.
std::string lookup(std::string_view uuid, std::string_view default_name);

// True when uuid designates the monitored sensor stream.
bool is_sensor_uuid(std::string_view uuid);

// Number of entries in the table (for tests / diagnostics)
std::size_t known_count();

}  // namespace gatt
