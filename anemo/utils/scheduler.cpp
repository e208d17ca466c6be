#include <anemo/utils/scheduler.hpp>
#include <anemo/utils/logger.hpp>

static const char* TAG = "SCHEDULER";

TimerScheduler::TimerScheduler()
    : next_id(1),
      running(false) {}

TimerScheduler::~TimerScheduler() {
    stop();
}

bool TimerScheduler::start() {
    std::lock_guard<std::mutex> lock(mutex);
    if (running) {
        return true;
    }
    running = true;
    worker = std::thread(&TimerScheduler::run, this);
    LOG_INFO(TAG, "%s", "Scheduler started");
    return true;
}

void TimerScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!running) {
            return;
        }
        running = false;
        entries.clear();
    }
    wake.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
    LOG_INFO(TAG, "%s", "Scheduler stopped");
}

ScheduledTaskId TimerScheduler::scheduleOnce(uint32_t delay_ms, std::function<void()> callback) {
    return add(delay_ms, 0, std::move(callback));
}

ScheduledTaskId TimerScheduler::schedulePeriodic(uint32_t period_ms, std::function<void()> callback) {
    if (period_ms == 0) {
        LOG_ERROR(TAG, "%s", "Periodic task needs a non-zero period");
        return invalid_task_id;
    }
    return add(period_ms, period_ms, std::move(callback));
}

bool TimerScheduler::cancel(ScheduledTaskId id) {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.erase(id) > 0;
}

std::size_t TimerScheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return entries.size();
}

ScheduledTaskId TimerScheduler::add(uint32_t delay_ms, uint32_t period_ms, std::function<void()> callback) {
    ScheduledTaskId id;
    {
        std::lock_guard<std::mutex> lock(mutex);
        id = next_id++;
        if (next_id == invalid_task_id) {
            next_id = 1;
        }
        Entry e;
        e.due = Clock::now() + std::chrono::milliseconds(delay_ms);
        e.period_ms = period_ms;
        e.callback = std::move(callback);
        entries[id] = std::move(e);
    }
    wake.notify_all();
    return id;
}

void TimerScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex);
    while (running) {
        if (entries.empty()) {
            wake.wait(lock);
            continue;
        }
        // Earliest due entry; the map is small (a handful of tasks)
        std::map<ScheduledTaskId, Entry>::iterator next = entries.begin();
        for (std::map<ScheduledTaskId, Entry>::iterator it = entries.begin(); it != entries.end(); ++it) {
            if (it->second.due < next->second.due) {
                next = it;
            }
        }
        Clock::time_point now = Clock::now();
        if (next->second.due > now) {
            wake.wait_until(lock, next->second.due);
            continue;
        }

        std::function<void()> callback = next->second.callback;
        uint32_t period_ms = next->second.period_ms;
        if (period_ms == 0) {
            entries.erase(next);
        } else {
            next->second.due += std::chrono::milliseconds(period_ms);
            if (next->second.due < now) {
                next->second.due = now + std::chrono::milliseconds(period_ms);
            }
        }

        lock.unlock();
        if (callback) {
            callback();
        }
        lock.lock();
    }
}
