#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

typedef uint32_t ScheduledTaskId;
static constexpr ScheduledTaskId invalid_task_id = 0;

// Delayed and periodic callbacks. Callbacks run on the scheduler's own context and
// must not block; they normally post a message to the queue of whoever owns the work.
class TaskScheduler {
public:
    virtual ~TaskScheduler() {}

    virtual ScheduledTaskId scheduleOnce(uint32_t delay_ms, std::function<void()> callback) = 0;
    virtual ScheduledTaskId schedulePeriodic(uint32_t period_ms, std::function<void()> callback) = 0;

    // Returns true if the task was still pending and will not run again.
    virtual bool cancel(ScheduledTaskId id) = 0;
};

// Single background thread serving all scheduled callbacks.
class TimerScheduler : public TaskScheduler {
public:
    TimerScheduler();
    ~TimerScheduler() override;

    TimerScheduler(const TimerScheduler&) = delete;
    TimerScheduler& operator=(const TimerScheduler&) = delete;

    bool start();
    void stop();

    ScheduledTaskId scheduleOnce(uint32_t delay_ms, std::function<void()> callback) override;
    ScheduledTaskId schedulePeriodic(uint32_t period_ms, std::function<void()> callback) override;
    bool cancel(ScheduledTaskId id) override;

    std::size_t pendingCount() const;

private:
    typedef std::chrono::steady_clock Clock;

    struct Entry {
        Clock::time_point due;
        uint32_t period_ms; // 0 for one-shot
        std::function<void()> callback;
    };

    ScheduledTaskId add(uint32_t delay_ms, uint32_t period_ms, std::function<void()> callback);
    void run();

    mutable std::mutex mutex;
    std::condition_variable wake;
    std::map<ScheduledTaskId, Entry> entries;
    ScheduledTaskId next_id;
    bool running;
    std::thread worker;
};

#endif // SCHEDULER_HPP
