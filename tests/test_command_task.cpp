#include <gtest/gtest.h>
#include <anemo/tasks/command_task.hpp>

namespace {
    Command parseOk(const std::string& line) {
        Command cmd;
        std::string error;
        EXPECT_TRUE(CommandTask::parseLine(line, cmd, error)) << line << ": " << error;
        return cmd;
    }

    std::string parseError(const std::string& line) {
        Command cmd;
        std::string error;
        EXPECT_FALSE(CommandTask::parseLine(line, cmd, error)) << line;
        return error;
    }
}

TEST(CommandParse, BlankLineIsSilentlyIgnored) {
    EXPECT_EQ("", parseError(""));
    EXPECT_EQ("", parseError("   \t "));
}

TEST(CommandParse, SimpleVerbs) {
    EXPECT_EQ(CommandType::HELP, parseOk("help").type);
    EXPECT_EQ(CommandType::HELP, parseOk("?").type);
    EXPECT_EQ(CommandType::QUIT, parseOk("quit").type);
    EXPECT_EQ(CommandType::QUIT, parseOk("  exit  ").type);
    EXPECT_EQ(CommandType::STATUS, parseOk("status").type);
}

TEST(CommandParse, TargetsAcceptAll) {
    Command cmd = parseOk("connect Sensor2");
    EXPECT_EQ(CommandType::CONNECT, cmd.type);
    EXPECT_EQ("Sensor2", cmd.sensor_id);

    cmd = parseOk("disconnect all");
    EXPECT_EQ(CommandType::DISCONNECT, cmd.type);
    EXPECT_TRUE(cmd.sensor_id.empty());

    cmd = parseOk("clear all");
    EXPECT_EQ(CommandType::CLEAR, cmd.type);

    EXPECT_EQ("Usage: connect <id|all>", parseError("connect"));
    EXPECT_EQ("Invalid sensor ID 'bad-id'", parseError("clear bad-id"));
}

TEST(CommandParse, InfoAndLatestNeedOneSensor) {
    Command cmd = parseOk("info Sensor1");
    EXPECT_EQ(CommandType::INFO, cmd.type);
    EXPECT_EQ("Sensor1", cmd.sensor_id);
    EXPECT_EQ(CommandType::LATEST, parseOk("latest Sensor4").type);

    EXPECT_EQ("Invalid sensor ID 'bad.id'", parseError("info bad.id"));
    EXPECT_EQ("Usage: latest <id>", parseError("latest Sensor1 Sensor2"));
}

TEST(CommandParse, Rate) {
    Command cmd = parseOk("rate 5");
    EXPECT_EQ(CommandType::SET_RATE, cmd.type);
    EXPECT_EQ(5, cmd.value);
    EXPECT_TRUE(cmd.sensor_id.empty());

    cmd = parseOk("rate 10 Sensor3");
    EXPECT_EQ(10, cmd.value);
    EXPECT_EQ("Sensor3", cmd.sensor_id);

    // Range is enforced by whoever applies it
    EXPECT_EQ(50, parseOk("rate 50").value);
    EXPECT_EQ("Invalid rate 'fast'", parseError("rate fast"));
    EXPECT_EQ("Invalid rate '5hz'", parseError("rate 5hz"));
}

TEST(CommandParse, SendKeepsRestOfLine) {
    Command cmd = parseOk("send Sensor1   set outputrate 10  ");
    EXPECT_EQ(CommandType::SEND_RAW, cmd.type);
    EXPECT_EQ("Sensor1", cmd.sensor_id);
    EXPECT_EQ("set outputrate 10", cmd.text);

    EXPECT_EQ("Usage: send <id> <command>", parseError("send Sensor1"));
}

TEST(CommandParse, Export) {
    Command cmd = parseOk("export Sensor2 out/data.csv");
    EXPECT_EQ(CommandType::EXPORT_SINGLE, cmd.type);
    EXPECT_EQ("Sensor2", cmd.sensor_id);
    EXPECT_EQ("out/data.csv", cmd.text);

    cmd = parseOk("export-multi all.csv");
    EXPECT_EQ(CommandType::EXPORT_MULTI, cmd.type);
    EXPECT_EQ("all.csv", cmd.text);
    EXPECT_TRUE(cmd.sensor_ids.empty());

    cmd = parseOk("export-multi pair.csv Sensor3 Sensor1");
    ASSERT_EQ(2u, cmd.sensor_ids.size());
    EXPECT_EQ("Sensor3", cmd.sensor_ids[0]);
    EXPECT_EQ("Sensor1", cmd.sensor_ids[1]);

    EXPECT_EQ("Usage: export <id> <file.csv>", parseError("export Sensor2"));
    EXPECT_EQ("Usage: export-multi <file.csv> [id...]", parseError("export-multi x.csv S1 S2 S3 S4 S5"));
}

TEST(CommandParse, UnknownVerb) {
    EXPECT_EQ("Unknown command 'launch' (type 'help')", parseError("launch Sensor1"));
}
