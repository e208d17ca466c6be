#ifndef SENSOR_LINK_CONFIG_HPP
#define SENSOR_LINK_CONFIG_HPP

#include <anemo/config/config.hpp>
#include <cstdint>
#include <string>
#include <vector>

// How to reach one sensor. Read by the core at connect time only.
struct SensorLinkConfig {
    std::string port;                        // e.g. /dev/ttyUSB0
    uint32_t    baud = Config::Sensors::default_baud;
    std::vector<std::string> init_commands;  // legacy CLI sequence, may be empty
};

#endif // SENSOR_LINK_CONFIG_HPP
