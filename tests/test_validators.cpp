#include <gtest/gtest.h>
#include <anemo/utils/validators.hpp>

TEST(Validators, BaudRates) {
    EXPECT_TRUE(Validators::isValidBaud(115200));
    EXPECT_TRUE(Validators::isValidBaud(9600));
    EXPECT_FALSE(Validators::isValidBaud(4800));
    EXPECT_FALSE(Validators::isValidBaud(0));

    uint32_t baud = 0;
    EXPECT_TRUE(Validators::parseBaud("57600", baud));
    EXPECT_EQ(57600u, baud);
    EXPECT_FALSE(Validators::parseBaud("57600x", baud));
    EXPECT_FALSE(Validators::parseBaud("", baud));
    EXPECT_FALSE(Validators::parseBaud("-9600", baud));
    EXPECT_FALSE(Validators::parseBaud("12345", baud));
}

TEST(Validators, SensorIds) {
    EXPECT_TRUE(Validators::isValidSensorId("Sensor1"));
    EXPECT_TRUE(Validators::isValidSensorId("mast_north_2"));
    EXPECT_TRUE(Validators::isValidSensorId("A"));
    EXPECT_FALSE(Validators::isValidSensorId(""));
    EXPECT_FALSE(Validators::isValidSensorId("Sensor 1"));
    EXPECT_FALSE(Validators::isValidSensorId("Sensor-1"));
    EXPECT_FALSE(Validators::isValidSensorId("abcdefghijklmnopqrstu"));  // 21 chars
}

TEST(Validators, Ports) {
    EXPECT_TRUE(Validators::isValidPort("/dev/ttyUSB0"));
    EXPECT_FALSE(Validators::isValidPort(""));
    EXPECT_FALSE(Validators::isValidPort("/dev/tty USB0"));
    EXPECT_FALSE(Validators::isValidPort(std::string(64, 'a')));
}

TEST(Validators, OutputRate) {
    EXPECT_TRUE(Validators::isValidOutputRate(1));
    EXPECT_TRUE(Validators::isValidOutputRate(10));
    EXPECT_FALSE(Validators::isValidOutputRate(0));
    EXPECT_FALSE(Validators::isValidOutputRate(11));
}

TEST(Validators, CsvPaths) {
    std::string err;
    EXPECT_TRUE(Validators::validateCsvPath("out/data.csv", err));
    EXPECT_TRUE(err.empty());
    EXPECT_TRUE(Validators::validateCsvPath("/tmp/DATA.CSV", err));

    EXPECT_FALSE(Validators::validateCsvPath("", err));
    EXPECT_EQ("File path is empty", err);
    EXPECT_FALSE(Validators::validateCsvPath("../escape.csv", err));
    EXPECT_EQ("Path contains invalid traversal (..)", err);
    EXPECT_FALSE(Validators::validateCsvPath("a/../b.csv", err));
    EXPECT_EQ("Path contains invalid traversal (..)", err);
    EXPECT_FALSE(Validators::validateCsvPath("data.txt", err));
    EXPECT_EQ("File must have .csv extension", err);
    EXPECT_FALSE(Validators::validateCsvPath("dir/.csv", err));
    EXPECT_EQ("File must have .csv extension", err);
}
