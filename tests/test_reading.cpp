#include <gtest/gtest.h>
#include <anemo/models/reading.hpp>
#include <anemo/protocol/line_parser.hpp>

namespace {
    ParsedFields parse(const char* line) {
        ParsedFields f;
        EXPECT_EQ(LineParser::ParseStatus::OK, LineParser::parseLine(line, f));
        return f;
    }
}

TEST(Reading, BuildsFromValidatedFields) {
    Reading r;
    ASSERT_TRUE(Reading::fromFields("Sensor1", parse("S 9.89 D 134 U -4.52 V 4.36 W -7.64 T 27.96 PI 2.1 RO -1.3"),
                                    1700000000123LL, r));
    EXPECT_STREQ("Sensor1", r.sensorId());
    EXPECT_EQ(1700000000123LL, r.timestampMs());
    EXPECT_DOUBLE_EQ(9.89, r.speed2d());
    EXPECT_DOUBLE_EQ(134.0, r.direction());
    EXPECT_DOUBLE_EQ(-4.52, r.uComponent());
    EXPECT_DOUBLE_EQ(4.36, r.vComponent());
    EXPECT_DOUBLE_EQ(-7.64, r.wComponent());
    EXPECT_DOUBLE_EQ(27.96, r.temperature());
    EXPECT_DOUBLE_EQ(2.1, r.pitch());
    EXPECT_DOUBLE_EQ(-1.3, r.roll());
    EXPECT_TRUE(r.isValid());
}

TEST(Reading, PitchAndRollDefaultToZero) {
    Reading r;
    ASSERT_TRUE(Reading::fromFields("Sensor2", parse("S 1 D 2 U 3 V 4 W 5 T 6"), 0, r));
    EXPECT_DOUBLE_EQ(0.0, r.pitch());
    EXPECT_DOUBLE_EQ(0.0, r.roll());
    EXPECT_TRUE(r.isValid());
}

TEST(Reading, ErrorSentinelMarksInvalid) {
    Reading r;
    ASSERT_TRUE(Reading::fromFields("Sensor1", parse("S -99.99 D 2 U 3 V 4 W 5 T 6"), 0, r));
    EXPECT_FALSE(r.isValid());
    EXPECT_NEAR(-99.99, r.speed2d(), 0.001);
}

TEST(Reading, RejectsMissingChannelOrBadId) {
    Reading r;
    EXPECT_FALSE(Reading::fromFields("Sensor1", parse("S 1 D 2 U 3 V 4 W 5"), 0, r));
    EXPECT_FALSE(Reading::fromFields("", parse("S 1 D 2 U 3 V 4 W 5 T 6"), 0, r));
    EXPECT_FALSE(Reading::fromFields("ThisIdIsFarTooLongForASensor", parse("S 1 D 2 U 3 V 4 W 5 T 6"), 0, r));
}
