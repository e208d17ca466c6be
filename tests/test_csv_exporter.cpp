#include <gtest/gtest.h>
#include <anemo/export/csv_exporter.hpp>
#include "support/reading_factory.hpp"
#include "support/temp_dir.hpp"
#include <cerrno>
#include <cstdlib>
#include <ctime>

namespace {
    static const std::string bom = "\xEF\xBB\xBF";

    class CsvExporterTest : public ::testing::Test {
    protected:
        void SetUp() override {
            setenv("TZ", "UTC", 1);
            tzset();
            ASSERT_TRUE(tmp.valid());
        }

        static std::vector<std::string> splitLines(const std::string& text) {
            std::vector<std::string> lines;
            std::size_t start = 0;
            std::size_t end;
            while ((end = text.find("\r\n", start)) != std::string::npos) {
                lines.push_back(text.substr(start, end - start));
                start = end + 2;
            }
            if (start < text.size()) {
                lines.push_back(text.substr(start));
            }
            return lines;
        }

        TempDir tmp;
    };
}

TEST_F(CsvExporterTest, SingleSensorFileLayout) {
    std::vector<Reading> readings;
    readings.push_back(makeReading("Sensor1", 1000, 9.876));
    readings.push_back(makeReading("Sensor1", 1100, 1.0));
    readings.push_back(makeReading("Sensor1", 1200, 2.0));

    std::string path = tmp.path("single.csv");
    ExportResult result = CsvExporter::writeSingleSensor(path, readings);
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(3u, result.rows);
    EXPECT_EQ("Successfully wrote 3 records", result.message);

    std::string content = TempDir::readFile(path);
    ASSERT_EQ(0u, content.find(bom));
    std::vector<std::string> lines = splitLines(content.substr(bom.size()));
    ASSERT_EQ(4u, lines.size());
    EXPECT_EQ("Timestamp,Sensor_ID,S,D,U,V,W,T,PI,RO", lines[0]);
    EXPECT_EQ(0u, lines[1].find("1970-01-01 00:00:01.000,Sensor1,9.88,180.00,-1.50,2.25,"));
    EXPECT_NE(std::string::npos, lines[1].find(",21.50,1.00,-2.00"));
    EXPECT_EQ(0u, lines[3].find("1970-01-01 00:00:01.200,Sensor1,2.00,"));
    EXPECT_EQ(std::string::npos, content.find("\n\n"));
}

TEST_F(CsvExporterTest, CreatesParentDirectories) {
    std::vector<Reading> readings(1, makeReading("Sensor2", 0));
    std::string path = tmp.path("a/b/c/out.CSV");
    ExportResult result = CsvExporter::writeSingleSensor(path, readings);
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_TRUE(TempDir::exists(path));
}

TEST_F(CsvExporterTest, EmptyInputWritesNothing) {
    std::string path = tmp.path("empty.csv");
    ExportResult result = CsvExporter::writeSingleSensor(path, std::vector<Reading>());
    EXPECT_FALSE(result.success);
    EXPECT_EQ("No data to write", result.message);
    EXPECT_FALSE(TempDir::exists(path));

    SensorSeries series;
    series["Sensor1"];
    result = CsvExporter::writeMultiSensor(path, series);
    EXPECT_FALSE(result.success);
    EXPECT_EQ("No data to write", result.message);
    EXPECT_FALSE(TempDir::exists(path));
}

TEST_F(CsvExporterTest, RejectsBadPaths) {
    std::vector<Reading> readings(1, makeReading("Sensor1", 0));

    ExportResult result = CsvExporter::writeSingleSensor(tmp.path("../escape.csv"), readings);
    EXPECT_FALSE(result.success);
    EXPECT_EQ("Path contains invalid traversal (..)", result.message);

    result = CsvExporter::writeSingleSensor(tmp.path("data.txt"), readings);
    EXPECT_FALSE(result.success);
    EXPECT_EQ("File must have .csv extension", result.message);

    // Path checks run before the no-data check
    result = CsvExporter::writeSingleSensor(tmp.path("data.txt"), std::vector<Reading>());
    EXPECT_EQ("File must have .csv extension", result.message);

    result = CsvExporter::writeSingleSensor("", readings);
    EXPECT_EQ("File path is empty", result.message);
}

TEST_F(CsvExporterTest, UnwritableTargetReportsCause) {
    std::vector<Reading> readings(1, makeReading("Sensor1", 0));
    std::string blocker = tmp.path("plain.csv");
    ASSERT_TRUE(CsvExporter::writeSingleSensor(blocker, readings).success);

    // Parent is a regular file
    ExportResult result = CsvExporter::writeSingleSensor(blocker + "/inner.csv", readings);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(0u, result.message.find("File write error: "));
}

TEST_F(CsvExporterTest, MultiSensorHeaderSortsIds) {
    std::vector<std::string> header = CsvExporter::multiSensorHeader({ "Sensor2", "Sensor1" });
    ASSERT_EQ(19u, header.size());
    EXPECT_EQ("Timestamp", header[0]);
    EXPECT_EQ("Sensor1_ID", header[1]);
    EXPECT_EQ("Sensor1_RO", header[9]);
    EXPECT_EQ("Sensor2_ID", header[10]);
    EXPECT_EQ("Sensor2_S", header[11]);
    EXPECT_EQ("Sensor2_RO", header[18]);
}

TEST_F(CsvExporterTest, MultiSensorFillsGapsWithNa) {
    SensorSeries series;
    series["Sensor2"].push_back(makeReading("Sensor2", 0, 2.0));
    series["Sensor1"].push_back(makeReading("Sensor1", 0, 1.0));
    series["Sensor1"].push_back(makeReading("Sensor1", 5000, 1.5));

    std::string path = tmp.path("multi.csv");
    ExportResult result = CsvExporter::writeMultiSensor(path, series);
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(2u, result.rows);
    EXPECT_EQ("Successfully wrote 2 synchronized records", result.message);

    std::string content = TempDir::readFile(path);
    ASSERT_EQ(0u, content.find(bom));
    std::vector<std::string> lines = splitLines(content.substr(bom.size()));
    ASSERT_EQ(3u, lines.size());
    EXPECT_EQ(0u, lines[0].find("Timestamp,Sensor1_ID,Sensor1_S,"));
    EXPECT_EQ(0u, lines[1].find("1970-01-01 00:00:00.000,Sensor1,1.00,"));
    EXPECT_NE(std::string::npos, lines[1].find(",Sensor2,2.00,"));
    EXPECT_EQ(0u, lines[2].find("1970-01-01 00:00:05.000,Sensor1,1.50,"));
    const std::string gap = ",N/A,N/A,N/A,N/A,N/A,N/A,N/A,N/A,N/A";
    ASSERT_GE(lines[2].size(), gap.size());
    EXPECT_EQ(gap, lines[2].substr(lines[2].size() - gap.size()));
}

TEST(CsvWriteError, DescribesCommonCauses) {
    EXPECT_EQ("Disk full - insufficient space to write file", CsvExporter::describeWriteError(ENOSPC));
    EXPECT_EQ("Permission denied - cannot write to file", CsvExporter::describeWriteError(EACCES));
    EXPECT_EQ("Permission denied - cannot write to file", CsvExporter::describeWriteError(EROFS));
    EXPECT_EQ(0u, CsvExporter::describeWriteError(EIO).find("File write error: "));
}
