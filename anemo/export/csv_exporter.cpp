#include <anemo/export/csv_exporter.hpp>
#include <anemo/config/config.hpp>
#include <anemo/utils/logger.hpp>
#include <anemo/utils/time_format.hpp>
#include <anemo/utils/validators.hpp>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sys/stat.h>

static const char* TAG = "CSV_EXPORT";

namespace {
    static constexpr unsigned char utf8_bom[3] = { 0xEF, 0xBB, 0xBF };
    static constexpr const char* line_end = "\r\n";
    static constexpr std::size_t channels_per_sensor = 9;

    // mkdir -p for the directory part of path
    static bool createParentDirs(const std::string& path, int& out_errno) {
        std::size_t pos = 0;
        while ((pos = path.find('/', pos + 1)) != std::string::npos) {
            std::string dir = path.substr(0, pos);
            if (::mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
                out_errno = errno;
                return false;
            }
        }
        return true;
    }

    static ExportResult failure(const std::string& message) {
        ExportResult r;
        r.success = false;
        r.message = message;
        LOG_ERROR(TAG, "%s", message.c_str());
        return r;
    }

    // Writes one CSV line and tracks the first stdio failure
    class CsvFile {
    public:
        CsvFile() : fp(nullptr), saved_errno(0) {}
        ~CsvFile() {
            if (fp != nullptr) {
                (void)std::fclose(fp);
            }
        }

        bool open(const std::string& path) {
            fp = std::fopen(path.c_str(), "wb");
            if (fp == nullptr) {
                saved_errno = errno;
                return false;
            }
            return writeRaw(utf8_bom, sizeof(utf8_bom));
        }

        bool writeFields(const std::vector<std::string>& fields) {
            std::string line;
            for (std::size_t i = 0; i < fields.size(); ++i) {
                if (i > 0) {
                    line += ',';
                }
                line += fields[i];
            }
            line += line_end;
            return writeRaw(line.data(), line.size());
        }

        bool close() {
            if (fp == nullptr) {
                return false;
            }
            int rc = std::fclose(fp);
            fp = nullptr;
            if (rc != 0 && saved_errno == 0) {
                saved_errno = errno;
            }
            return rc == 0 && saved_errno == 0;
        }

        int error() const { return saved_errno; }

    private:
        bool writeRaw(const void* data, std::size_t len) {
            if (saved_errno != 0) {
                return false;
            }
            if (std::fwrite(data, 1, len, fp) != len) {
                saved_errno = errno != 0 ? errno : EIO;
                return false;
            }
            return true;
        }

        std::FILE* fp;
        int saved_errno;
    };

    static std::string formatNumber(double value) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.*f", Config::Export::decimals, value);
        return buf;
    }

    static std::string formatTimestamp(int64_t ts_ms) {
        char buf[TimeFormat::timestamp_len + 1];
        if (!TimeFormat::formatTimestampMs(ts_ms, buf, sizeof(buf))) {
            return std::string();
        }
        return buf;
    }

    static void appendChannels(const Reading& r, std::vector<std::string>& fields) {
        fields.push_back(formatNumber(r.speed2d()));
        fields.push_back(formatNumber(r.direction()));
        fields.push_back(formatNumber(r.uComponent()));
        fields.push_back(formatNumber(r.vComponent()));
        fields.push_back(formatNumber(r.wComponent()));
        fields.push_back(formatNumber(r.temperature()));
        fields.push_back(formatNumber(r.pitch()));
        fields.push_back(formatNumber(r.roll()));
    }

    static const char* const channel_suffixes[channels_per_sensor] = {
        "_ID", "_S", "_D", "_U", "_V", "_W", "_T", "_PI", "_RO"
    };

    static bool prepare(const std::string& path, CsvFile& file, ExportResult& out_failure) {
        std::string reason;
        if (!Validators::validateCsvPath(path, reason)) {
            out_failure = failure(reason);
            return false;
        }
        int err = 0;
        if (!createParentDirs(path, err)) {
            out_failure = failure(CsvExporter::describeWriteError(err));
            return false;
        }
        if (!file.open(path)) {
            out_failure = failure(CsvExporter::describeWriteError(file.error()));
            return false;
        }
        return true;
    }
}

namespace CsvExporter {
    std::string describeWriteError(int error_number) {
        switch (error_number) {
            case ENOSPC:
#ifdef EDQUOT
            case EDQUOT:
#endif
                return "Disk full - insufficient space to write file";
            case EACCES:
            case EPERM:
            case EROFS:
                return "Permission denied - cannot write to file";
            default:
                return std::string("File write error: ") + std::strerror(error_number);
        }
    }

    std::vector<std::string> singleSensorHeader() {
        return { "Timestamp", "Sensor_ID", "S", "D", "U", "V", "W", "T", "PI", "RO" };
    }

    std::vector<std::string> multiSensorHeader(std::vector<std::string> sensor_ids) {
        std::sort(sensor_ids.begin(), sensor_ids.end());
        std::vector<std::string> header;
        header.reserve(1 + sensor_ids.size() * channels_per_sensor);
        header.push_back("Timestamp");
        for (const std::string& id : sensor_ids) {
            for (const char* suffix : channel_suffixes) {
                header.push_back(id + suffix);
            }
        }
        return header;
    }

    ExportResult writeSingleSensor(const std::string& path, const std::vector<Reading>& readings) {
        if (readings.empty()) {
            std::string reason;
            if (!Validators::validateCsvPath(path, reason)) {
                return failure(reason);
            }
            LOG_WARN(TAG, "%s", "No data to write");
            ExportResult r;
            r.message = "No data to write";
            return r;
        }

        CsvFile file;
        ExportResult result;
        if (!prepare(path, file, result)) {
            return result;
        }

        bool ok = file.writeFields(singleSensorHeader());
        std::vector<std::string> fields;
        for (std::size_t i = 0; ok && i < readings.size(); ++i) {
            const Reading& r = readings[i];
            fields.clear();
            fields.push_back(formatTimestamp(r.timestampMs()));
            fields.push_back(r.sensorId());
            appendChannels(r, fields);
            ok = file.writeFields(fields);
        }
        if (!file.close() || !ok) {
            return failure(describeWriteError(file.error()));
        }

        LOG_INFO(TAG, "Wrote %u records to %s", static_cast<unsigned>(readings.size()), path.c_str());
        result.success = true;
        result.rows = readings.size();
        result.message = "Successfully wrote " + std::to_string(readings.size()) + " records";
        return result;
    }

    ExportResult writeMultiSensor(const std::string& path, const SensorSeries& series) {
        bool any_data = false;
        for (const SensorSeries::value_type& entry : series) {
            if (!entry.second.empty()) {
                any_data = true;
                break;
            }
        }
        if (!any_data) {
            std::string reason;
            if (!Validators::validateCsvPath(path, reason)) {
                return failure(reason);
            }
            LOG_WARN(TAG, "%s", "No data to write");
            ExportResult r;
            r.message = "No data to write";
            return r;
        }

        CsvFile file;
        ExportResult result;
        if (!prepare(path, file, result)) {
            return result;
        }

        std::vector<SyncRow> rows = Synchronizer::align(series);
        std::vector<std::string> ids = Synchronizer::sensorOrder(series);

        bool ok = file.writeFields(multiSensorHeader(ids));
        std::vector<std::string> fields;
        for (std::size_t i = 0; ok && i < rows.size(); ++i) {
            const SyncRow& row = rows[i];
            fields.clear();
            fields.push_back(formatTimestamp(row.ts_ms));
            for (const Reading* cell : row.cells) {
                if (cell == nullptr) {
                    for (std::size_t c = 0; c < channels_per_sensor; ++c) {
                        fields.push_back(Config::Export::missing_cell);
                    }
                } else {
                    fields.push_back(cell->sensorId());
                    appendChannels(*cell, fields);
                }
            }
            ok = file.writeFields(fields);
        }
        if (!file.close() || !ok) {
            return failure(describeWriteError(file.error()));
        }

        LOG_INFO(TAG, "Wrote %u synchronized records to %s", static_cast<unsigned>(rows.size()), path.c_str());
        result.success = true;
        result.rows = rows.size();
        result.message = "Successfully wrote " + std::to_string(rows.size()) + " synchronized records";
        return result;
    }
}
