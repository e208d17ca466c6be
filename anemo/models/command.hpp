#ifndef COMMAND_HPP
#define COMMAND_HPP

#include <anemo/config/config.hpp>
#include <anemo/utils/message_queue.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Console commands, executed by the application loop
enum class CommandType : int32_t {
    HELP = 0,
    CONNECT = 1,        // sensor_id, or all configured sensors when empty
    DISCONNECT = 2,     // sensor_id, or all when empty
    STATUS = 3,
    INFO = 4,           // sensor_id
    LATEST = 5,         // sensor_id
    CLEAR = 6,          // sensor_id, or all when empty
    SET_RATE = 7,       // value = Hz; sensor_id, or all connected when empty
    SEND_RAW = 8,       // sensor_id, text = command
    EXPORT_SINGLE = 9,  // sensor_id, text = path
    EXPORT_MULTI = 10,  // text = path; sensor_ids subset, all when empty
    QUIT = 11,
};

struct Command {
    uint64_t    timestamp_ms = 0;  // uptime when the command was parsed
    CommandType type = CommandType::HELP;
    std::string sensor_id;
    int32_t     value = 0;
    std::string text;
    std::vector<std::string> sensor_ids;
};

typedef MessageQueue<Command, Config::Tasks::Controller::command_queue_len> CommandQueue;

#endif // COMMAND_HPP
