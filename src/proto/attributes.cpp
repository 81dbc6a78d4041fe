#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>

#include "proto/attributes.hpp"
#include "util/constants.hpp"

namespace gatt
{
namespace
{

struct Entry
{
    std::string_view uuid;
    std::string_view name;
};

// clang-format off
constexpr Entry kTable[] = {
    // services
    {"0000180d-0000-1000-8000-00805f9b34fb", "Heart Rate Service"},
    {"0000180a-0000-1000-8000-00805f9b34fb", "Device Information Service"},
    {"00001810-0000-1000-8000-00805f9b34fb", "Band Service"},
    {"0000fe40-cc7a-482a-984a-7f2ed5b3e58f", "Band Custom Service"},
    // generic characteristics
    {"00002a29-0000-1000-8000-00805f9b34fb", "Manufacturer Name String"},
    {"00002a26-0000-1000-8000-00805f9b34fb", "Firmware Revision String"},
    {"00002a37-0000-1000-8000-00805f9b34fb", "MIO Measurement (legacy)"},
    {"00002902-0000-1000-8000-00805f9b34fb", "Client Characteristic Configuration"},
    {"0000ffe1-0000-1000-8000-00805f9b34fb", "Serial Bridge"},
    // custom service handles
    {"0000fe41-8e22-4541-9d4c-21edae82ed19", "Set ADC Current Treshold Hdle"},
    {"0000fe42-8e22-4541-9d4c-21edae82ed19", "Shutdown Current Hdle"},
    {"0000fe43-8e22-4541-9d4c-21edae82ed19", "Start Up Step Hdle"},
    {"0000fe44-8e22-4541-9d4c-21edae82ed19", "Start Up Time Hdle"},
    {"0000fe45-8e22-4541-9d4c-21edae82ed19", "Dead Zone Hdle"},
    {"0000fe46-8e22-4541-9d4c-21edae82ed19", "Open Threshold Hdle"},
    {"0000fe47-8e22-4541-9d4c-21edae82ed19", "Close Threshold Hdle"},
    {"0000fe48-8e22-4541-9d4c-21edae82ed19", "Motor Open Hdle"},
    {"0000fe49-8e22-4541-9d4c-21edae82ed19", "Motor Close Hdle"},
    {"0000fe4a-8e22-4541-9d4c-21edae82ed19", "Sensitivity Hdle"},
    // band stack
    {"43680000-4d74-1001-726b-526f64696f6e", "Open Threshold"},
    {"43680001-4d74-1001-726b-526f64696f6e", "Close Threshold"},
    {"43680002-4d74-1001-726b-526f64696f6e", "Open Motor"},
    {"43680003-4d74-1001-726b-526f64696f6e", "Close Motor"},
    {"43680004-4d74-1001-726b-526f64696f6e", "Add Gesture"},
    {"43680005-4d74-1001-726b-526f64696f6e", "Set Gesture"},
    {"43680006-4d74-1001-726b-526f64696f6e", "Set Reverse"},
    {"43680007-4d74-1001-726b-526f64696f6e", "Set One Channel"},
    {"43680008-4d74-1001-726b-526f64696f6e", "Calibration"},
    {"43680009-4d74-1001-726b-526f64696f6e", "Calibration Status"},
    {"4368000a-4d74-1001-726b-526f64696f6e", "Move All Fingers"},
    {"4368000b-4d74-1001-726b-526f64696f6e", "Change Gesture"},
    {"4368000c-4d74-1001-726b-526f64696f6e", "Shutdown Current"},
    {"43680100-4d74-1001-726b-526f64696f6e", "Reset To Factory Settings"},
    {"43680200-4d74-1001-726b-526f64696f6e", "Sensor Options"},
    {"43680201-4d74-1001-726b-526f64696f6e", "MIO Measurement"},
    {"43680202-4d74-1001-726b-526f64696f6e", "Sensor Version"},
    {"43680203-4d74-1001-726b-526f64696f6e", "Sensor Enabled"},
    {"43680300-4d74-1001-726b-526f64696f6e", "Telemetry Number"},
    {"43680400-4d74-1001-726b-526f64696f6e", "Rotation Gesture"},
    {"43680590-4d74-1001-726b-526f64696f6e", "Driver Version"},
};
// clang-format on

bool uuid_eq(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

}  // namespace

std::string lookup(std::string_view uuid, std::string_view default_name)
{
    auto it = std::find_if(std::begin(kTable), std::end(kTable),
                           [&](const Entry &e) { return uuid_eq(e.uuid, uuid); });
    if (it == std::end(kTable))
        return std::string(default_name);
    return std::string(it->name);
}

bool is_sensor_uuid(std::string_view uuid)
{
    return uuid_eq(uuid, constants::SENSOR_UUID);
}

std::size_t known_count()
{
    return std::size(kTable);
}

}  // namespace gatt
