#ifndef CLI_OPTIONS_HPP
#define CLI_OPTIONS_HPP

#include <anemo/models/sensor_link_config.hpp>
#include <anemo/utils/logger.hpp>
#include <cstdint>
#include <string>
#include <vector>

struct SensorSpec {
    std::string      sensor_id;
    SensorLinkConfig link;
};

struct CliOptions {
    LogLevel log_level = LogLevel::INFO;
    bool     autoconnect = false;
    std::vector<SensorSpec> sensors;
};

enum class CliParseStatus : uint8_t {
    RUN = 0,
    HELP = 1,
    INVALID = 2,
};

namespace CliOptionsParser {
    // anemo_gateway [-v|-q] [--sensor ID=PORT[@BAUD][:CMD1;CMD2...]]... [--autoconnect]
    // On INVALID out_error says which argument was rejected.
    CliParseStatus parse(int argc, const char* const argv[], CliOptions& out_options, std::string& out_error);

    // ID=PORT[@BAUD][:CMD1;CMD2...]; ID must name one of the sensor slots
    bool parseSensorSpec(const std::string& text, SensorSpec& out_spec, std::string& out_error);

    void printUsage(const char* program);
}

#endif // CLI_OPTIONS_HPP
