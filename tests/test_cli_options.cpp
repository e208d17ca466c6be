#include <gtest/gtest.h>
#include <anemo/config/cli_options.hpp>

namespace {
    CliParseStatus parseArgs(const std::vector<const char*>& args, CliOptions& options, std::string& error) {
        std::vector<const char*> argv;
        argv.push_back("anemo_gateway");
        argv.insert(argv.end(), args.begin(), args.end());
        return CliOptionsParser::parse(static_cast<int>(argv.size()), argv.data(), options, error);
    }
}

TEST(CliOptions, DefaultsWithoutArguments) {
    CliOptions options;
    std::string error;
    ASSERT_EQ(CliParseStatus::RUN, parseArgs({}, options, error));
    EXPECT_EQ(LogLevel::INFO, options.log_level);
    EXPECT_FALSE(options.autoconnect);
    EXPECT_TRUE(options.sensors.empty());
}

TEST(CliOptions, FlagsAndSensors) {
    CliOptions options;
    std::string error;
    ASSERT_EQ(CliParseStatus::RUN,
              parseArgs({ "-v", "--sensor", "Sensor2=/dev/ttyUSB1@9600", "--autoconnect",
                          "--sensor", "Sensor1=/dev/ttyUSB0" }, options, error)) << error;
    EXPECT_EQ(LogLevel::DEBUG, options.log_level);
    EXPECT_TRUE(options.autoconnect);
    ASSERT_EQ(2u, options.sensors.size());
    EXPECT_EQ("Sensor2", options.sensors[0].sensor_id);
    EXPECT_EQ("/dev/ttyUSB1", options.sensors[0].link.port);
    EXPECT_EQ(9600u, options.sensors[0].link.baud);
    EXPECT_EQ(115200u, options.sensors[1].link.baud);

    ASSERT_EQ(CliParseStatus::RUN, parseArgs({ "--quiet" }, options, error));
    EXPECT_EQ(LogLevel::WARN, options.log_level);
}

TEST(CliOptions, HelpWins) {
    CliOptions options;
    std::string error;
    EXPECT_EQ(CliParseStatus::HELP, parseArgs({ "-v", "--help" }, options, error));
    EXPECT_EQ(CliParseStatus::HELP, parseArgs({ "-h" }, options, error));
}

TEST(CliOptions, InvalidArguments) {
    CliOptions options;
    std::string error;
    EXPECT_EQ(CliParseStatus::INVALID, parseArgs({ "--bogus" }, options, error));
    EXPECT_EQ("Unknown argument '--bogus'", error);

    EXPECT_EQ(CliParseStatus::INVALID, parseArgs({ "--sensor" }, options, error));
    EXPECT_EQ("--sensor requires a value", error);

    EXPECT_EQ(CliParseStatus::INVALID,
              parseArgs({ "--sensor", "Sensor1=/dev/a", "--sensor", "Sensor1=/dev/b" }, options, error));
    EXPECT_EQ("Sensor configured twice: Sensor1", error);
}

TEST(SensorSpec, InitCommandsAreSplitAndTrimmed) {
    SensorSpec spec;
    std::string error;
    ASSERT_TRUE(CliOptionsParser::parseSensorSpec("Sensor3=/dev/ttyS0@57600: set outputrate 10 ;; show ;",
                                                  spec, error)) << error;
    EXPECT_EQ("Sensor3", spec.sensor_id);
    EXPECT_EQ("/dev/ttyS0", spec.link.port);
    EXPECT_EQ(57600u, spec.link.baud);
    ASSERT_EQ(2u, spec.link.init_commands.size());
    EXPECT_EQ("set outputrate 10", spec.link.init_commands[0]);
    EXPECT_EQ("show", spec.link.init_commands[1]);
}

TEST(SensorSpec, AtSignInCommandsIsNotABaud) {
    SensorSpec spec;
    std::string error;
    ASSERT_TRUE(CliOptionsParser::parseSensorSpec("Sensor1=/dev/ttyUSB0:echo a@b", spec, error)) << error;
    EXPECT_EQ("/dev/ttyUSB0", spec.link.port);
    EXPECT_EQ(115200u, spec.link.baud);
    ASSERT_EQ(1u, spec.link.init_commands.size());
    EXPECT_EQ("echo a@b", spec.link.init_commands[0]);
}

TEST(SensorSpec, Rejections) {
    SensorSpec spec;
    std::string error;
    EXPECT_FALSE(CliOptionsParser::parseSensorSpec("/dev/ttyUSB0", spec, error));
    EXPECT_EQ(0u, error.find("Invalid sensor format"));

    EXPECT_FALSE(CliOptionsParser::parseSensorSpec("Sensor5=/dev/ttyUSB0", spec, error));
    EXPECT_EQ("Unknown sensor ID: Sensor5", error);

    EXPECT_FALSE(CliOptionsParser::parseSensorSpec("Sensor1=/dev/ttyUSB0@1234", spec, error));
    EXPECT_EQ("Invalid baud rate '1234'", error);

    EXPECT_FALSE(CliOptionsParser::parseSensorSpec("Sensor1=@9600", spec, error));
    EXPECT_EQ("Invalid port ''", error);

    std::string too_long = "Sensor1=/dev/ttyUSB0:" + std::string(64, 'x');
    EXPECT_FALSE(CliOptionsParser::parseSensorSpec(too_long, spec, error));
    EXPECT_EQ(0u, error.find("Init command too long"));

    std::string many = "Sensor1=/dev/ttyUSB0:";
    for (int i = 0; i < 17; ++i) {
        many += "c;";
    }
    EXPECT_FALSE(CliOptionsParser::parseSensorSpec(many, spec, error));
    EXPECT_EQ("Too many init commands", error);
}
