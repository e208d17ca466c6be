#include <anemo/utils/validators.hpp>
#include <anemo/config/config.hpp>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace Validators {
    bool isValidBaud(uint32_t baud) {
        for (uint32_t rate : valid_baud_rates) {
            if (rate == baud) {
                return true;
            }
        }
        return false;
    }

    bool parseBaud(const std::string& text, uint32_t& out_baud) {
        if (text.empty() || text.size() > 7) {
            return false;
        }
        for (char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return false;
            }
        }
        errno = 0;
        unsigned long v = std::strtoul(text.c_str(), nullptr, 10);
        if (errno != 0 || !isValidBaud(static_cast<uint32_t>(v))) {
            return false;
        }
        out_baud = static_cast<uint32_t>(v);
        return true;
    }

    bool isValidSensorId(const std::string& sensor_id) {
        if (sensor_id.empty() || sensor_id.size() > Config::Sensors::id_max_len) {
            return false;
        }
        for (char c : sensor_id) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
                return false;
            }
        }
        return true;
    }

    bool isValidPort(const std::string& port) {
        if (port.empty() || port.size() > Config::Sensors::port_max_len) {
            return false;
        }
        for (char c : port) {
            unsigned char u = static_cast<unsigned char>(c);
            if (std::isspace(u) || std::iscntrl(u)) {
                return false;
            }
        }
        return true;
    }

    bool isValidOutputRate(int rate_hz) {
        return rate_hz >= Config::Output::min_rate_hz && rate_hz <= Config::Output::max_rate_hz;
    }

    bool validateCsvPath(const std::string& path, std::string& out_error) {
        if (path.empty()) {
            out_error = "File path is empty";
            return false;
        }

        // Any ".." path component is traversal
        std::size_t start = 0;
        while (start <= path.size()) {
            std::size_t end = path.find('/', start);
            if (end == std::string::npos) {
                end = path.size();
            }
            if (path.compare(start, end - start, "..") == 0) {
                out_error = "Path contains invalid traversal (..)";
                return false;
            }
            start = end + 1;
        }

        std::size_t slash = path.rfind('/');
        std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
        std::size_t dot = name.rfind('.');
        std::string ext;
        // A leading dot is a hidden file, not an extension
        if (dot != std::string::npos && dot > 0) {
            ext = name.substr(dot);
        }
        for (char& c : ext) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (ext != ".csv") {
            out_error = "File must have .csv extension";
            return false;
        }

        out_error.clear();
        return true;
    }
}
