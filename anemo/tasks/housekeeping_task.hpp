#ifndef HOUSEKEEPING_TASK_HPP
#define HOUSEKEEPING_TASK_HPP

#include <anemo/tasks/app_controller.hpp>
#include <anemo/utils/scheduler.hpp>

namespace HousekeepingTask {
    // Schedules the periodic memory check and rate statistics (each honours
    // its feature toggle). The app controller must outlive the scheduler.
    void create(TaskScheduler& scheduler, const AppController& app);

    // Resident set size of this process from /proc/self/statm
    bool readResidentMemoryMb(double& out_mb);

    // One memory sample; logs a warning above the threshold. Returns false if
    // the sample could not be taken.
    bool checkMemory(double warning_threshold_mb);

    // One statistics pass over all sensors
    void logRateStats(const AppController& app);
}

#endif // HOUSEKEEPING_TASK_HPP
