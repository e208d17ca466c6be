#ifndef SYNCHRONIZER_HPP
#define SYNCHRONIZER_HPP

#include <anemo/config/config.hpp>
#include <anemo/models/reading.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

// One row of the common time axis. cells has one entry per sensor, in sensor
// id order; nullptr means no reading within tolerance. Pointers refer into the
// map passed to Synchronizer::align() and live as long as it does.
struct SyncRow {
    int64_t ts_ms;
    std::vector<const Reading*> cells;
};

typedef std::map<std::string, std::vector<Reading>> SensorSeries;

namespace Synchronizer {
    // The axis is the sorted union of every timestamp of every sensor. For each
    // axis point each sensor contributes the reading nearest in time, provided
    // it is at most tolerance_ms away; a reading may fill several rows. When two
    // readings are equally near, the later one wins.
    std::vector<SyncRow> align(const SensorSeries& series, int64_t tolerance_ms = Config::Sync::tolerance_ms);

    // Sensor ids in column order (ascending)
    std::vector<std::string> sensorOrder(const SensorSeries& series);
}

#endif // SYNCHRONIZER_HPP
