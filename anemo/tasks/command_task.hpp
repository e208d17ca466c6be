#ifndef COMMAND_TASK_HPP
#define COMMAND_TASK_HPP

#include <anemo/models/command.hpp>
#include <cstdio>
#include <string>

namespace CommandTask {
    // Start the thread that reads console lines from stdin and posts them to
    // command_queue. End of input posts QUIT.
    bool create(CommandQueue& command_queue);

    // Stop and join the reader thread (it polls stdin, so this returns promptly)
    void stop();

    // One console line into a command. Returns false with out_error set for
    // malformed input; blank lines are rejected with an empty error.
    bool parseLine(const std::string& line, Command& out_cmd, std::string& out_error);

    void printHelp(std::FILE* out);
}

#endif // COMMAND_TASK_HPP
