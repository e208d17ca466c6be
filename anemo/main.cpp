#include <anemo/config/cli_options.hpp>
#include <anemo/config/config.hpp>
#include <anemo/models/command.hpp>
#include <anemo/tasks/app_controller.hpp>
#include <anemo/tasks/command_task.hpp>
#include <anemo/tasks/housekeeping_task.hpp>
#include <anemo/utils/logger.hpp>
#include <anemo/utils/scheduler.hpp>
#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <string>

static const char* TAG = "MAIN";

namespace {
    static std::atomic<bool> s_shutdown(false);

    static void signalHandler(int sig) {
        (void)sig;
        s_shutdown.store(true);
    }
}

int main(int argc, char* argv[]) {
    CliOptions options;
    std::string error;
    CliParseStatus status = CliOptionsParser::parse(argc, argv, options, error);
    if (status == CliParseStatus::HELP) {
        CliOptionsParser::printUsage(argv[0]);
        return 0;
    }
    if (status == CliParseStatus::INVALID) {
        std::fprintf(stderr, "Error: %s\n", error.c_str());
        CliOptionsParser::printUsage(argv[0]);
        return 1;
    }

    Logger::setLevel(options.log_level);
    LOG_INFO(TAG, "%s", "---Anemometer gateway started---");

    struct sigaction sa{};
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    TimerScheduler scheduler;
    if (!scheduler.start()) {
        LOG_ERROR(TAG, "%s", "Failed to start scheduler");
        return 1;
    }

    AppController app(scheduler);
    for (const SensorSpec& spec : options.sensors) {
        if (!app.configureSensor(spec.sensor_id, spec.link)) {
            LOG_ERROR(TAG, "Invalid configuration for %s", spec.sensor_id.c_str());
            scheduler.stop();
            return 1;
        }
    }
    if (options.sensors.empty()) {
        LOG_WARN(TAG, "%s", "No sensors configured (use --sensor ID=PORT)");
    }

    // Housekeeping after the sensors exist
    HousekeepingTask::create(scheduler, app);

    static CommandQueue command_queue;
    if (Config::Features::enable_console) {
        if (!CommandTask::create(command_queue)) {
            LOG_ERROR(TAG, "%s", "Console unavailable");
        }
    }

    if (options.autoconnect) {
        for (const SensorSpec& spec : options.sensors) {
            (void)app.connectSensor(spec.sensor_id);
        }
    }

    bool running = true;
    while (running && !s_shutdown.load()) {
        // Idle sensors: block on the console queue instead of spinning
        uint32_t wait_ms = app.pumpAll() > 0 ? 0 : Config::Tasks::Controller::pump_wait_ms;
        Command cmd;
        if (command_queue.receive(cmd, wait_ms)) {
            running = app.handleCommand(cmd);
        }
    }

    LOG_INFO(TAG, "%s", "Shutting down");
    CommandTask::stop();
    app.disconnectAll();
    scheduler.stop();
    LOG_INFO(TAG, "%s", "---Anemometer gateway stopped---");
    return 0;
}
