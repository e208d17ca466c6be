#include <anemo/config/cli_options.hpp>
#include <anemo/config/config.hpp>
#include <anemo/utils/validators.hpp>
#include <cstdio>
#include <cstring>

namespace {
    static std::string trim(const std::string& s) {
        std::size_t b = s.find_first_not_of(" \t");
        if (b == std::string::npos) {
            return std::string();
        }
        std::size_t e = s.find_last_not_of(" \t");
        return s.substr(b, e - b + 1);
    }

    static bool isSensorSlot(const std::string& id) {
        for (const char* slot : Config::Sensors::default_ids) {
            if (id == slot) {
                return true;
            }
        }
        return false;
    }

    static bool parseInitCommands(const std::string& text, std::vector<std::string>& out, std::string& out_error) {
        std::size_t start = 0;
        while (start <= text.size()) {
            std::size_t end = text.find(';', start);
            if (end == std::string::npos) {
                end = text.size();
            }
            std::string cmd = trim(text.substr(start, end - start));
            if (!cmd.empty()) {
                if (cmd.size() > Config::Sensors::init_command_max_len) {
                    out_error = "Init command too long: '" + cmd + "'";
                    return false;
                }
                if (out.size() >= Config::Sensors::max_init_commands) {
                    out_error = "Too many init commands";
                    return false;
                }
                out.push_back(cmd);
            }
            start = end + 1;
        }
        return true;
    }
}

namespace CliOptionsParser {
    bool parseSensorSpec(const std::string& text, SensorSpec& out_spec, std::string& out_error) {
        std::size_t eq = text.find('=');
        if (eq == std::string::npos) {
            out_error = "Invalid sensor format '" + text + "' (expected ID=PORT[@BAUD][:CMDS])";
            return false;
        }

        SensorSpec spec;
        spec.sensor_id = text.substr(0, eq);
        if (!Validators::isValidSensorId(spec.sensor_id) || !isSensorSlot(spec.sensor_id)) {
            out_error = "Unknown sensor ID: " + spec.sensor_id;
            return false;
        }

        std::string rest = text.substr(eq + 1);
        std::size_t colon = rest.find(':');
        if (colon != std::string::npos) {
            if (!parseInitCommands(rest.substr(colon + 1), spec.link.init_commands, out_error)) {
                return false;
            }
            rest = rest.substr(0, colon);
        }

        std::size_t at = rest.rfind('@');
        if (at != std::string::npos) {
            std::string baud_text = rest.substr(at + 1);
            if (!Validators::parseBaud(baud_text, spec.link.baud)) {
                out_error = "Invalid baud rate '" + baud_text + "'";
                return false;
            }
            rest = rest.substr(0, at);
        }

        if (!Validators::isValidPort(rest)) {
            out_error = "Invalid port '" + rest + "'";
            return false;
        }
        spec.link.port = rest;
        out_spec = spec;
        return true;
    }

    CliParseStatus parse(int argc, const char* const argv[], CliOptions& out_options, std::string& out_error) {
        CliOptions options;
        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
                options.log_level = LogLevel::DEBUG;
            } else if (std::strcmp(argv[i], "-q") == 0 || std::strcmp(argv[i], "--quiet") == 0) {
                options.log_level = LogLevel::WARN;
            } else if (std::strcmp(argv[i], "--autoconnect") == 0) {
                options.autoconnect = true;
            } else if (std::strcmp(argv[i], "--sensor") == 0) {
                if (i + 1 >= argc) {
                    out_error = "--sensor requires a value";
                    return CliParseStatus::INVALID;
                }
                SensorSpec spec;
                if (!parseSensorSpec(argv[++i], spec, out_error)) {
                    return CliParseStatus::INVALID;
                }
                for (const SensorSpec& existing : options.sensors) {
                    if (existing.sensor_id == spec.sensor_id) {
                        out_error = "Sensor configured twice: " + spec.sensor_id;
                        return CliParseStatus::INVALID;
                    }
                }
                options.sensors.push_back(spec);
            } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
                return CliParseStatus::HELP;
            } else {
                out_error = std::string("Unknown argument '") + argv[i] + "'";
                return CliParseStatus::INVALID;
            }
        }
        out_options = options;
        return CliParseStatus::RUN;
    }

    void printUsage(const char* program) {
        std::printf("Usage: %s [-v|-q] [--sensor ID=PORT[@BAUD][:CMD1;CMD2...]]... [--autoconnect]\n\n"
                    "  -v, --verbose    debug logging\n"
                    "  -q, --quiet      warnings and errors only\n"
                    "  --sensor         serial link of one sensor, ID is Sensor1..Sensor4\n"
                    "                   BAUD is 9600, 19200, 38400, 57600 or 115200 (default 115200)\n"
                    "                   CMDS are sent in legacy CLI mode when {json} is not answered\n"
                    "  --autoconnect    connect all configured sensors at startup\n\n"
                    "Example: %s --sensor Sensor1=/dev/ttyUSB0@115200 --sensor Sensor2=/dev/ttyUSB1 --autoconnect\n",
                    program, program);
    }
}
