#ifndef CSV_EXPORTER_HPP
#define CSV_EXPORTER_HPP

#include <anemo/export/synchronizer.hpp>
#include <anemo/models/reading.hpp>
#include <cstddef>
#include <string>
#include <vector>

// Outcome of an export. Failures never escape as exceptions; message holds a
// human-readable cause.
struct ExportResult {
    bool success = false;
    std::string message;
    std::size_t rows = 0;  // data rows written (header excluded)
};

// UTF-8 (with BOM) CSV files, CRLF line endings, numbers with two decimals,
// timestamps as local "YYYY-MM-DD HH:MM:SS.mmm". Parent directories are created.
namespace CsvExporter {
    // Timestamp, Sensor_ID, S, D, U, V, W, T, PI, RO
    std::vector<std::string> singleSensorHeader();

    // Timestamp, then {id}_ID, {id}_S ... {id}_RO per sensor in ascending id order
    std::vector<std::string> multiSensorHeader(std::vector<std::string> sensor_ids);

    ExportResult writeSingleSensor(const std::string& path, const std::vector<Reading>& readings);

    // Synchronized rows across sensors; a sensor without a match in a row gets "N/A" in all nine cells
    ExportResult writeMultiSensor(const std::string& path, const SensorSeries& series);

    // Cause text for a failed write (ENOSPC, EACCES, ...)
    std::string describeWriteError(int error_number);
}

#endif // CSV_EXPORTER_HPP
