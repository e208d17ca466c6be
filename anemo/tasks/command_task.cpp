#include <anemo/tasks/command_task.hpp>
#include <anemo/config/config.hpp>
#include <anemo/utils/logger.hpp>
#include <anemo/utils/time_format.hpp>
#include <anemo/utils/validators.hpp>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <poll.h>
#include <sstream>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <vector>

static const char* TAG = "CMD_TASK";

namespace {
    static constexpr int stdin_poll_ms = 200;
    static constexpr std::size_t max_line_len = 512;

    static std::thread s_reader;
    static std::atomic<bool> s_stop(false);
    static CommandQueue* s_command_queue = nullptr;

    static std::vector<std::string> tokenize(const std::string& line) {
        std::vector<std::string> tokens;
        std::istringstream in(line);
        std::string token;
        while (in >> token) {
            tokens.push_back(token);
        }
        return tokens;
    }

    // Remainder of line after the first `skip` tokens, leading blanks removed
    static std::string remainderAfter(const std::string& line, std::size_t skip) {
        std::size_t pos = 0;
        for (std::size_t i = 0; i < skip; ++i) {
            pos = line.find_first_not_of(" \t", pos);
            if (pos == std::string::npos) {
                return std::string();
            }
            pos = line.find_first_of(" \t", pos);
            if (pos == std::string::npos) {
                return std::string();
            }
        }
        pos = line.find_first_not_of(" \t", pos);
        if (pos == std::string::npos) {
            return std::string();
        }
        std::size_t end = line.find_last_not_of(" \t\r");
        return line.substr(pos, end - pos + 1);
    }

    // "all" selects every sensor and leaves the id empty
    static bool parseTarget(const std::string& token, bool allow_all, std::string& out_id, std::string& out_error) {
        if (allow_all && token == "all") {
            out_id.clear();
            return true;
        }
        if (!Validators::isValidSensorId(token)) {
            out_error = "Invalid sensor ID '" + token + "'";
            return false;
        }
        out_id = token;
        return true;
    }

    static bool parseInt(const std::string& token, int32_t& out_value) {
        if (token.empty()) {
            return false;
        }
        char* end = nullptr;
        errno = 0;
        long v = std::strtol(token.c_str(), &end, 10);
        if (errno != 0 || end == nullptr || *end != '\0' || v < INT32_MIN || v > INT32_MAX) {
            return false;
        }
        out_value = static_cast<int32_t>(v);
        return true;
    }

    static bool expectArgs(const std::vector<std::string>& tokens, std::size_t min_args, std::size_t max_args,
                           const char* usage, std::string& out_error) {
        std::size_t args = tokens.size() - 1;
        if (args < min_args || args > max_args) {
            out_error = std::string("Usage: ") + usage;
            return false;
        }
        return true;
    }

    static void post(const Command& cmd) {
        if (!s_command_queue->send(cmd, Config::Tasks::Controller::event_post_timeout_ms)) {
            LOG_WARN(TAG, "%s", "Command queue full, command dropped");
        }
    }

    static void handleLine(const std::string& line) {
        Command cmd;
        std::string error;
        if (!CommandTask::parseLine(line, cmd, error)) {
            if (!error.empty()) {
                LOG_ERROR(TAG, "%s", error.c_str());
            }
            return;
        }
        post(cmd);
    }

    static void readerLoop() {
        LOG_DEBUG(TAG, "%s", "Console reader started");
        std::string pending;
        bool dropping = false;
        char chunk[256];

        while (!s_stop.load()) {
            struct pollfd pfd;
            pfd.fd = STDIN_FILENO;
            pfd.events = POLLIN;
            pfd.revents = 0;
            int rc = ::poll(&pfd, 1, stdin_poll_ms);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                LOG_ERROR(TAG, "stdin poll failed: %s", std::strerror(errno));
                break;
            }
            if (rc == 0) {
                continue;
            }

            ssize_t n = ::read(STDIN_FILENO, chunk, sizeof(chunk));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) {
                    continue;
                }
                LOG_ERROR(TAG, "stdin read failed: %s", std::strerror(errno));
                break;
            }
            if (n == 0) {
                if (!pending.empty() && !dropping) {
                    handleLine(pending);
                }
                LOG_INFO(TAG, "%s", "End of console input");
                Command quit;
                quit.timestamp_ms = TimeFormat::uptimeMs();
                quit.type = CommandType::QUIT;
                post(quit);
                break;
            }

            for (ssize_t i = 0; i < n; ++i) {
                char c = chunk[i];
                if (c == '\n') {
                    if (!dropping) {
                        handleLine(pending);
                    }
                    pending.clear();
                    dropping = false;
                } else if (!dropping) {
                    pending += c;
                    if (pending.size() > max_line_len) {
                        LOG_WARN(TAG, "%s", "Console line too long, discarded");
                        pending.clear();
                        dropping = true;
                    }
                }
            }
        }
        LOG_DEBUG(TAG, "%s", "Console reader stopped");
    }
}

namespace CommandTask {
    bool parseLine(const std::string& line, Command& out_cmd, std::string& out_error) {
        out_error.clear();
        std::vector<std::string> tokens = tokenize(line);
        if (tokens.empty()) {
            return false;
        }

        Command cmd;
        cmd.timestamp_ms = TimeFormat::uptimeMs();
        const std::string& verb = tokens[0];

        if (verb == "help" || verb == "?") {
            cmd.type = CommandType::HELP;
        } else if (verb == "quit" || verb == "exit") {
            cmd.type = CommandType::QUIT;
        } else if (verb == "status") {
            cmd.type = CommandType::STATUS;
        } else if (verb == "connect" || verb == "disconnect" || verb == "clear") {
            if (!expectArgs(tokens, 1, 1, (verb + " <id|all>").c_str(), out_error) ||
                !parseTarget(tokens[1], true, cmd.sensor_id, out_error)) {
                return false;
            }
            cmd.type = verb == "connect" ? CommandType::CONNECT
                     : verb == "disconnect" ? CommandType::DISCONNECT
                     : CommandType::CLEAR;
        } else if (verb == "info" || verb == "latest") {
            if (!expectArgs(tokens, 1, 1, (verb + " <id>").c_str(), out_error) ||
                !parseTarget(tokens[1], false, cmd.sensor_id, out_error)) {
                return false;
            }
            cmd.type = verb == "info" ? CommandType::INFO : CommandType::LATEST;
        } else if (verb == "rate") {
            if (!expectArgs(tokens, 1, 2, "rate <hz> [id]", out_error)) {
                return false;
            }
            if (!parseInt(tokens[1], cmd.value)) {
                out_error = "Invalid rate '" + tokens[1] + "'";
                return false;
            }
            if (tokens.size() == 3 && !parseTarget(tokens[2], true, cmd.sensor_id, out_error)) {
                return false;
            }
            cmd.type = CommandType::SET_RATE;
        } else if (verb == "send") {
            if (tokens.size() < 3) {
                out_error = "Usage: send <id> <command>";
                return false;
            }
            if (!parseTarget(tokens[1], false, cmd.sensor_id, out_error)) {
                return false;
            }
            cmd.text = remainderAfter(line, 2);
            cmd.type = CommandType::SEND_RAW;
        } else if (verb == "export") {
            if (!expectArgs(tokens, 2, 2, "export <id> <file.csv>", out_error) ||
                !parseTarget(tokens[1], false, cmd.sensor_id, out_error)) {
                return false;
            }
            cmd.text = tokens[2];
            cmd.type = CommandType::EXPORT_SINGLE;
        } else if (verb == "export-multi") {
            if (!expectArgs(tokens, 1, 1 + Config::Sensors::max_sensors, "export-multi <file.csv> [id...]",
                            out_error)) {
                return false;
            }
            cmd.text = tokens[1];
            for (std::size_t i = 2; i < tokens.size(); ++i) {
                std::string id;
                if (!parseTarget(tokens[i], false, id, out_error)) {
                    return false;
                }
                cmd.sensor_ids.push_back(id);
            }
            cmd.type = CommandType::EXPORT_MULTI;
        } else {
            out_error = "Unknown command '" + verb + "' (type 'help')";
            return false;
        }

        out_cmd = cmd;
        return true;
    }

    bool create(CommandQueue& command_queue) {
        if (s_reader.joinable()) {
            LOG_WARN(TAG, "%s", "Console reader already running");
            return false;
        }
        s_command_queue = &command_queue;
        s_stop.store(false);
        try {
            s_reader = std::thread(readerLoop);
        } catch (const std::system_error& e) {
            LOG_ERROR(TAG, "Failed to create console reader: %s", e.what());
            return false;
        }
        LOG_INFO(TAG, "%s", "Command task started");
        return true;
    }

    void stop() {
        s_stop.store(true);
        if (s_reader.joinable()) {
            s_reader.join();
        }
    }

    void printHelp(std::FILE* out) {
        std::fprintf(out,
                     "Commands:\n"
                     "  connect <id|all>               open the configured serial link(s)\n"
                     "  disconnect <id|all>            close link(s), cancel reconnection\n"
                     "  status                         link state of every sensor\n"
                     "  info <id>                      negotiated protocol and device info\n"
                     "  latest <id>                    most recent reading\n"
                     "  clear <id|all>                 empty reading buffer(s)\n"
                     "  rate <hz> [id|all]             output rate %d-%d Hz (JSON protocol sensors)\n"
                     "  send <id> <command>            raw command to the sensor\n"
                     "  export <id> <file.csv>         single-sensor CSV\n"
                     "  export-multi <file.csv> [id..] time-synchronized CSV (all sensors by default)\n"
                     "  quit                           disconnect everything and exit\n",
                     Config::Output::min_rate_hz, Config::Output::max_rate_hz);
    }
}
