#include <anemo/protocol/response_reader.hpp>
#include <anemo/protocol/line_parser.hpp>
#include <anemo/config/config.hpp>
#include <anemo/utils/logger.hpp>
#include <mjson.h>
#include <algorithm>
#include <chrono>
#include <thread>

static const char* TAG = "RESPONSE";

namespace {
    typedef std::chrono::steady_clock Clock;

    static std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        std::size_t b = s.find_first_not_of(ws);
        if (b == std::string::npos) {
            return std::string();
        }
        std::size_t e = s.find_last_not_of(ws);
        return s.substr(b, e - b + 1);
    }

    static std::string joinLines(const std::vector<std::string>& lines) {
        std::string out;
        for (std::size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) {
                out += '\n';
            }
            out += lines[i];
        }
        return out;
    }

    // If json is an object with exactly one member and that member is an
    // object, returns the member's text.
    static bool unwrapSingleKey(const std::string& json, std::string& out_inner) {
        const char* buf = json.c_str();
        int len = static_cast<int>(json.size());
        int koff = 0, klen = 0, voff = 0, vlen = 0, vtype = 0;
        int members = 0;
        int inner_off = 0, inner_len = 0, inner_type = 0;
        int off = 0;
        while ((off = mjson_next(buf, len, off, &koff, &klen, &voff, &vlen, &vtype)) != 0) {
            if (members == 0) {
                inner_off = voff;
                inner_len = vlen;
                inner_type = vtype;
            }
            ++members;
        }
        if (members != 1 || inner_type != MJSON_TOK_OBJECT) {
            return false;
        }
        out_inner.assign(buf + inner_off, static_cast<std::size_t>(inner_len));
        return true;
    }
}

ResponseFramer::ResponseFramer()
    : brace_depth(0),
      in_object(false),
      complete(false) {}

bool ResponseFramer::addLine(const std::string& raw_line) {
    if (complete) {
        return true;
    }
    std::string line = trim(raw_line);
    if (line.empty() || LineParser::looksLikeTelemetry(line.c_str())) {
        return false;
    }

    collected.push_back(line);
    int opens = static_cast<int>(std::count(line.begin(), line.end(), '{'));
    int closes = static_cast<int>(std::count(line.begin(), line.end(), '}'));
    if (opens > 0) {
        in_object = true;
    }
    brace_depth += opens - closes;

    if (in_object && brace_depth <= 0) {
        complete = true;
    } else if (collected.size() >= Config::Negotiation::max_response_lines) {
        LOG_WARN(TAG, "Reply exceeds %u lines, truncating",
                 static_cast<unsigned>(Config::Negotiation::max_response_lines));
        complete = true;
    }
    return complete;
}

namespace ResponseReader {
    const char* statusName(ResponseStatus status) {
        switch (status) {
            case ResponseStatus::JSON:        return "json";
            case ResponseStatus::RAW:         return "raw";
            case ResponseStatus::NO_RESPONSE: return "no response";
            case ResponseStatus::REJECTED:    return "rejected";
            case ResponseStatus::IO_ERROR:    return "i/o error";
            case ResponseStatus::STOPPED:     return "stopped";
        }
        return "unknown";
    }

    bool isWellFormedJson(const std::string& text) {
        if (text.empty()) {
            return false;
        }
        int len = static_cast<int>(text.size());
        return mjson(text.c_str(), len, nullptr, nullptr) == len;
    }

    CommandResponse classify(const std::vector<std::string>& lines) {
        CommandResponse resp;
        if (lines.empty()) {
            resp.status = ResponseStatus::NO_RESPONSE;
            return resp;
        }

        std::string text = joinLines(lines);
        if (text.find("Invalid Parameter") != std::string::npos ||
            text.find("Invalid Command") != std::string::npos) {
            resp.status = ResponseStatus::REJECTED;
            resp.text = text;
            return resp;
        }

        if (text.front() == '{' && text.back() == '}') {
            if (isWellFormedJson(text)) {
                std::string inner;
                resp.status = ResponseStatus::JSON;
                resp.text = unwrapSingleKey(text, inner) ? inner : text;
                return resp;
            }
            // Outer braces may belong to a non-JSON wrapper around the object
            std::size_t inner_start = text.find('{', 1);
            std::size_t inner_end = text.rfind('}', text.size() - 2);
            if (inner_start != std::string::npos && inner_end != std::string::npos && inner_end > inner_start) {
                std::string inner = text.substr(inner_start, inner_end - inner_start + 1);
                if (isWellFormedJson(inner)) {
                    resp.status = ResponseStatus::JSON;
                    resp.text = inner;
                    return resp;
                }
            }
        }

        resp.status = ResponseStatus::RAW;
        resp.text = text;
        return resp;
    }

    bool writePaced(SerialPort& port, const std::string& command, uint32_t inter_byte_delay_ms) {
        for (std::size_t i = 0; i < command.size(); ++i) {
            uint8_t byte = static_cast<uint8_t>(command[i]);
            if (!port.write(&byte, 1)) {
                LOG_ERROR(TAG, "Write of '%s' failed: %s", command.c_str(), port.lastError().c_str());
                return false;
            }
            if (inter_byte_delay_ms > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(inter_byte_delay_ms));
            }
        }
        if (!port.drain()) {
            LOG_ERROR(TAG, "Flush after '%s' failed: %s", command.c_str(), port.lastError().c_str());
            return false;
        }
        return true;
    }

    CommandResponse collect(SerialPort& port, uint32_t timeout_ms, const std::atomic<bool>& stop_requested) {
        ResponseFramer framer;
        Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
        std::string line;

        while (!framer.isComplete()) {
            if (stop_requested.load()) {
                CommandResponse stopped;
                stopped.status = ResponseStatus::STOPPED;
                return stopped;
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
            if (left <= 0) {
                break;
            }
            uint32_t wait_ms = static_cast<uint32_t>(std::min<long long>(left, Config::Serial::read_timeout_ms));

            ReadStatus st = port.readLine(line, wait_ms);
            if (st == ReadStatus::ERROR) {
                LOG_ERROR(TAG, "Read failed while waiting for reply: %s", port.lastError().c_str());
                CommandResponse failed;
                failed.status = ResponseStatus::IO_ERROR;
                failed.text = port.lastError();
                return failed;
            }
            if (st == ReadStatus::LINE) {
                LOG_DEBUG(TAG, "Reply line: %s", line.c_str());
                (void)framer.addLine(line);
            }
        }

        return classify(framer.lines());
    }
}
