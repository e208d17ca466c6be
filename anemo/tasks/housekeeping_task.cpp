#include <anemo/tasks/housekeeping_task.hpp>
#include <anemo/config/config.hpp>
#include <anemo/state/reading_buffer.hpp>
#include <anemo/utils/logger.hpp>
#include <anemo/utils/time_format.hpp>
#include <cstdio>
#include <inttypes.h>
#include <map>
#include <mutex>
#include <string>
#include <unistd.h>

static const char* TAG = "HOUSEKEEPING";

namespace {
    struct RateSample {
        uint64_t appended = 0;
        uint64_t at_ms = 0;
    };

    // Previous counters per sensor
    static std::mutex s_rate_mutex;
    static std::map<std::string, RateSample> s_last_samples;
}

namespace HousekeepingTask {
    bool readResidentMemoryMb(double& out_mb) {
        std::FILE* fp = std::fopen("/proc/self/statm", "r");
        if (fp == nullptr) {
            return false;
        }
        unsigned long size_pages = 0;
        unsigned long resident_pages = 0;
        int fields = std::fscanf(fp, "%lu %lu", &size_pages, &resident_pages);
        (void)std::fclose(fp);
        if (fields != 2) {
            return false;
        }
        long page_size = ::sysconf(_SC_PAGESIZE);
        if (page_size <= 0) {
            return false;
        }
        out_mb = static_cast<double>(resident_pages) * static_cast<double>(page_size) / (1024.0 * 1024.0);
        return true;
    }

    bool checkMemory(double warning_threshold_mb) {
        double memory_mb = 0.0;
        if (!readResidentMemoryMb(memory_mb)) {
            LOG_ERROR(TAG, "%s", "Error checking memory usage");
            return false;
        }
        LOG_DEBUG(TAG, "Memory usage: %.1f MB", memory_mb);
        if (memory_mb > warning_threshold_mb) {
            LOG_WARN(TAG, "Memory usage exceeded threshold: %.1f MB (threshold: %.1f MB)", memory_mb,
                     warning_threshold_mb);
        }
        return true;
    }

    void logRateStats(const AppController& app) {
        std::lock_guard<std::mutex> lock(s_rate_mutex);
        uint64_t now = TimeFormat::uptimeMs();
        for (const std::string& id : app.allSensorIds()) {
            const SensorController* controller = app.sensor(id);
            if (controller == nullptr || !controller->isConnected()) {
                continue;
            }
            const ReadingBuffer& buffer = controller->buffer();
            uint64_t appended = buffer.appendedCount();

            RateSample& last = s_last_samples[id];
            double rate = 0.0;
            if (last.at_ms != 0 && now > last.at_ms && appended >= last.appended) {
                rate = static_cast<double>(appended - last.appended) * 1000.0 / static_cast<double>(now - last.at_ms);
            }
            last.appended = appended;
            last.at_ms = now;

            std::size_t size = buffer.size();
            LOG_INFO(TAG, "%s: %.1f readings/s, buffer %u/%u (%.1f%%), overflows %" PRIu64 ", evicted %" PRIu64,
                     id.c_str(), rate, static_cast<unsigned>(size), static_cast<unsigned>(ReadingBuffer::capacity),
                     100.0 * static_cast<double>(size) / static_cast<double>(ReadingBuffer::capacity),
                     controller->overflowCount(), buffer.evictedCount());
        }
    }

    void create(TaskScheduler& scheduler, const AppController& app) {
        if (Config::Features::enable_memory_monitor) {
            ScheduledTaskId id = scheduler.schedulePeriodic(Config::Tasks::Memory::period_ms, []() {
                (void)checkMemory(Config::Tasks::Memory::warning_threshold_mb);
            });
            if (id == invalid_task_id) {
                LOG_ERROR(TAG, "%s", "Failed to schedule memory monitor");
            } else {
                LOG_INFO(TAG, "Memory monitor started: checking every %u seconds, threshold=%.1fMB",
                         static_cast<unsigned>(Config::Tasks::Memory::period_ms / 1000),
                         Config::Tasks::Memory::warning_threshold_mb);
            }
        }
        if (Config::Features::enable_rate_stats) {
            const AppController* target = &app;
            ScheduledTaskId id = scheduler.schedulePeriodic(Config::Tasks::Stats::period_ms, [target]() {
                logRateStats(*target);
            });
            if (id == invalid_task_id) {
                LOG_ERROR(TAG, "%s", "Failed to schedule rate statistics");
            }
        }
    }
}
