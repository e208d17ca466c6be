#include <gtest/gtest.h>
#include <anemo/tasks/app_controller.hpp>
#include "support/fake_serial_port.hpp"
#include "support/fast_timings.hpp"
#include "support/manual_scheduler.hpp"
#include "support/reading_factory.hpp"
#include "support/temp_dir.hpp"
#include <cstdio>
#include <functional>
#include <thread>

namespace {
    class AppControllerTest : public ::testing::Test {
    protected:
        AppControllerTest()
            : link(std::make_shared<FakeSerialLink>()),
              out(std::tmpfile()),
              app(scheduler, portFactory(link), fastTimings(), out) {}

        ~AppControllerTest() override {
            app.disconnectAll();
            if (out != nullptr) {
                std::fclose(out);
            }
        }

        void SetUp() override {
            ASSERT_NE(nullptr, out);
            ASSERT_TRUE(tmp.valid());
        }

        static SerialPortFactory portFactory(std::shared_ptr<FakeSerialLink> shared) {
            return [shared]() { return std::unique_ptr<SerialPort>(new FakeSerialPort(shared)); };
        }

        std::string printed() {
            std::fflush(out);
            long size = std::ftell(out);
            std::string text(size > 0 ? static_cast<std::size_t>(size) : 0, '\0');
            std::rewind(out);
            if (!text.empty()) {
                text.resize(std::fread(&text[0], 1, text.size(), out));
            }
            std::fseek(out, 0, SEEK_END);
            return text;
        }

        void fill(const std::string& id, int count, int64_t start_ms) {
            for (int i = 0; i < count; ++i) {
                (void)app.sensor(id)->buffer().append(makeReading(id.c_str(), start_ms + i * 100, 1.0 + i));
            }
        }

        static Command command(CommandType type, const std::string& sensor_id = std::string()) {
            Command cmd;
            cmd.timestamp_ms = 0;
            cmd.type = type;
            cmd.sensor_id = sensor_id;
            cmd.value = 0;
            return cmd;
        }

        bool pumpUntil(const std::function<bool()>& condition, int timeout_ms = 3000) {
            for (int waited = 0; waited < timeout_ms; waited += 10) {
                if (app.pumpAll() == 0) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                }
                if (condition()) {
                    return true;
                }
            }
            return condition();
        }

        std::shared_ptr<FakeSerialLink> link;
        ManualScheduler scheduler;
        std::FILE* out;
        AppController app;
        TempDir tmp;
    };
}

TEST_F(AppControllerTest, FourSensorSlots) {
    std::vector<std::string> ids = app.allSensorIds();
    ASSERT_EQ(4u, ids.size());
    EXPECT_EQ("Sensor1", ids[0]);
    EXPECT_EQ("Sensor4", ids[3]);
    EXPECT_EQ(nullptr, app.sensor("Sensor5"));
    EXPECT_TRUE(app.connectedSensorIds().empty());
}

TEST_F(AppControllerTest, ExportSingleMessages) {
    ExportResult r = app.exportSingle("Sensor9", tmp.path("x.csv"));
    EXPECT_FALSE(r.success);
    EXPECT_EQ("Unknown sensor ID: Sensor9", r.message);

    r = app.exportSingle("Sensor1", tmp.path("x.csv"));
    EXPECT_FALSE(r.success);
    EXPECT_EQ("No data available for Sensor1", r.message);

    fill("Sensor1", 5, 1000);
    r = app.exportSingle("Sensor1", tmp.path("x.txt"));
    EXPECT_EQ("File must have .csv extension", r.message);

    r = app.exportSingle("Sensor1", tmp.path("x.csv"));
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(5u, r.rows);
    EXPECT_TRUE(TempDir::exists(tmp.path("x.csv")));
    // Export leaves the buffer alone
    EXPECT_EQ(5u, app.sensor("Sensor1")->buffer().size());
}

TEST_F(AppControllerTest, ExportMultiMessages) {
    ExportResult r = app.exportMulti(tmp.path("m.csv"), std::vector<std::string>());
    EXPECT_EQ("No sensors specified for export", r.message);

    r = app.exportMulti(tmp.path("m.csv"), { "Sensor1", "Bogus" });
    EXPECT_EQ("Unknown sensor ID: Bogus", r.message);

    // Path is checked before ids
    r = app.exportMulti(tmp.path("../m.csv"), { "Bogus" });
    EXPECT_EQ("Path contains invalid traversal (..)", r.message);

    r = app.exportMulti(tmp.path("m.csv"));
    EXPECT_FALSE(r.success);
    EXPECT_EQ("No data available from any selected sensor", r.message);
    EXPECT_FALSE(TempDir::exists(tmp.path("m.csv")));
}

TEST_F(AppControllerTest, ExportMultiSkipsSensorsWithoutData) {
    fill("Sensor3", 3, 0);
    fill("Sensor1", 2, 50);

    ExportResult r = app.exportMulti(tmp.path("m.csv"), { "Sensor3", "Sensor2", "Sensor1" });
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(5u, r.rows);

    std::string content = TempDir::readFile(tmp.path("m.csv"));
    EXPECT_NE(std::string::npos, content.find("Timestamp,Sensor1_ID"));
    EXPECT_NE(std::string::npos, content.find("Sensor3_ID"));
    EXPECT_EQ(std::string::npos, content.find("Sensor2_ID"));
}

TEST_F(AppControllerTest, QuitEndsCommandLoop) {
    EXPECT_TRUE(app.handleCommand(command(CommandType::STATUS)));
    EXPECT_FALSE(app.handleCommand(command(CommandType::QUIT)));
}

TEST_F(AppControllerTest, StatusAndHelpOutput) {
    SensorLinkConfig cfg;
    cfg.port = "/dev/fake0";
    cfg.baud = 115200;
    ASSERT_TRUE(app.configureSensor("Sensor2", cfg));

    app.handleCommand(command(CommandType::STATUS));
    std::string text = printed();
    EXPECT_NE(std::string::npos, text.find("Sensor1  (not configured)"));
    EXPECT_NE(std::string::npos, text.find("Sensor2  /dev/fake0@115200 disconnected"));

    app.handleCommand(command(CommandType::HELP));
    EXPECT_NE(std::string::npos, printed().find("export-multi <file.csv>"));
}

TEST_F(AppControllerTest, UnknownSensorIsReported) {
    app.handleCommand(command(CommandType::INFO, "Sensor7"));
    EXPECT_NE(std::string::npos, printed().find("Unknown sensor ID: Sensor7"));
    EXPECT_FALSE(app.connectSensor("Sensor7"));
}

TEST_F(AppControllerTest, LatestAndClear) {
    app.handleCommand(command(CommandType::LATEST, "Sensor1"));
    EXPECT_NE(std::string::npos, printed().find("Sensor1: no readings"));

    fill("Sensor1", 3, 0);
    fill("Sensor4", 1, 0);
    app.handleCommand(command(CommandType::LATEST, "Sensor1"));
    EXPECT_NE(std::string::npos, printed().find("S=3.00 D=180.00"));

    app.handleCommand(command(CommandType::CLEAR, "Sensor1"));
    EXPECT_EQ(0u, app.sensor("Sensor1")->buffer().size());
    EXPECT_EQ(1u, app.sensor("Sensor4")->buffer().size());

    app.handleCommand(command(CommandType::CLEAR));
    EXPECT_EQ(0u, app.sensor("Sensor4")->buffer().size());
}

TEST_F(AppControllerTest, ExportCommandPrintsResult) {
    Command cmd = command(CommandType::EXPORT_SINGLE, "Sensor2");
    cmd.text = tmp.path("s2.csv");
    app.handleCommand(cmd);
    EXPECT_NE(std::string::npos, printed().find("Export failed: No data available for Sensor2"));

    fill("Sensor2", 2, 0);
    app.handleCommand(cmd);
    EXPECT_NE(std::string::npos, printed().find("Export complete: Successfully wrote 2 records"));
}

TEST_F(AppControllerTest, ConnectCommandDrivesListenerOutput) {
    SensorLinkConfig cfg;
    cfg.port = "/dev/fake0";
    cfg.baud = 9600;
    ASSERT_TRUE(app.configureSensor("Sensor1", cfg));

    app.handleCommand(command(CommandType::CONNECT, "Sensor1"));
    ASSERT_TRUE(pumpUntil([this]() { return app.connectedSensorIds().size() == 1; }));
    ASSERT_TRUE(pumpUntil([this]() { return printed().find("[Sensor1] Protocol: Unknown") != std::string::npos; }));
    std::string text = printed();
    EXPECT_NE(std::string::npos, text.find("Sensor1: connecting"));
    EXPECT_NE(std::string::npos, text.find("[Sensor1] Connected"));

    // Unconfigured slots are skipped by "connect all"
    app.handleCommand(command(CommandType::CONNECT));
    EXPECT_EQ(1, link->openCount());

    app.handleCommand(command(CommandType::DISCONNECT));
    EXPECT_TRUE(app.connectedSensorIds().empty());
    EXPECT_NE(std::string::npos, printed().find("[Sensor1] Disconnected"));
}

TEST_F(AppControllerTest, OutputRateNeedsConnectedSensors) {
    EXPECT_EQ(0u, app.setOutputRateAll(0));
    EXPECT_EQ(0u, app.setOutputRateAll(5));

    Command cmd = command(CommandType::SET_RATE);
    cmd.value = 5;
    app.handleCommand(cmd);
    EXPECT_NE(std::string::npos, printed().find("Output rate 5 Hz sent to 0 sensors"));
}
