#ifndef APP_CONTROLLER_HPP
#define APP_CONTROLLER_HPP

#include <anemo/export/csv_exporter.hpp>
#include <anemo/models/command.hpp>
#include <anemo/tasks/sensor_controller.hpp>
#include <anemo/utils/scheduler.hpp>
#include <cstddef>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

// Owns the four sensor slots (Sensor1..Sensor4) and runs console commands
// against them. Presentation is plain text on `out`.
//
// Everything except the const queries must be called from the application loop,
// the same context that calls pumpAll().
class AppController : public SensorEventListener {
public:
    explicit AppController(TaskScheduler& scheduler,
                           SerialPortFactory port_factory = &makePosixSerialPort,
                           const NegotiationTimings& timings = NegotiationTimings::defaults(),
                           std::FILE* out = stdout);
    ~AppController() override;

    AppController(const AppController&) = delete;
    AppController& operator=(const AppController&) = delete;

    bool configureSensor(const std::string& sensor_id, const SensorLinkConfig& link);

    // Connects with the link set by configureSensor()
    bool connectSensor(const std::string& sensor_id);
    bool disconnectSensor(const std::string& sensor_id);
    void disconnectAll();

    std::vector<std::string> allSensorIds() const;
    std::vector<std::string> connectedSensorIds() const;

    // nullptr for an unknown id
    SensorController* sensor(const std::string& sensor_id);
    const SensorController* sensor(const std::string& sensor_id) const;

    // Applies pending worker events of every sensor without waiting.
    std::size_t pumpAll();

    ExportResult exportSingle(const std::string& sensor_id, const std::string& path);

    // All sensors
    ExportResult exportMulti(const std::string& path);
    // Only the listed sensors; an empty list is rejected
    ExportResult exportMulti(const std::string& path, const std::vector<std::string>& sensor_ids);

    // Returns the number of sensors the rate was sent to
    std::size_t setOutputRateAll(int rate_hz);

    // Returns false once the application should exit
    bool handleCommand(const Command& cmd);

    // SensorEventListener
    void onConnectionStatus(const std::string& sensor_id, bool connected) override;
    void onError(const std::string& sensor_id, const std::string& message) override;
    void onProgress(const std::string& sensor_id, const std::string& step) override;
    void onSensorInfo(const std::string& sensor_id, const NegotiatedProtocol& protocol) override;
    void onReconnectExhausted(const std::string& sensor_id, int attempts) override;

private:
    SensorController* requireSensor(const std::string& sensor_id);
    void printStatus();
    void printInfo(const SensorController& controller);
    void printLatest(const SensorController& controller);
    void printResult(const ExportResult& result);

    std::vector<std::unique_ptr<SensorController>> controllers;
    std::FILE* out;
};

#endif // APP_CONTROLLER_HPP
