#include <anemo/export/synchronizer.hpp>
#include <anemo/utils/logger.hpp>
#include <algorithm>

static const char* TAG = "SYNC";

namespace {
    // Time-ordered view of one sensor's readings; equal timestamps keep wire order
    typedef std::vector<const Reading*> OrderedReadings;

    static OrderedReadings orderByTime(const std::vector<Reading>& readings) {
        OrderedReadings ordered;
        ordered.reserve(readings.size());
        for (const Reading& r : readings) {
            ordered.push_back(&r);
        }
        std::stable_sort(ordered.begin(), ordered.end(),
                         [](const Reading* a, const Reading* b) { return a->timestampMs() < b->timestampMs(); });
        return ordered;
    }

    static const Reading* nearest(const OrderedReadings& ordered, int64_t ts_ms, int64_t tolerance_ms) {
        if (ordered.empty()) {
            return nullptr;
        }
        // First reading at or after ts_ms
        OrderedReadings::const_iterator at_or_after = std::lower_bound(
            ordered.begin(), ordered.end(), ts_ms,
            [](const Reading* r, int64_t t) { return r->timestampMs() < t; });

        const Reading* best = nullptr;
        int64_t best_diff = tolerance_ms + 1;

        if (at_or_after != ordered.begin()) {
            const Reading* before = *(at_or_after - 1);
            int64_t diff = ts_ms - before->timestampMs();
            if (diff <= tolerance_ms) {
                best = before;
                best_diff = diff;
            }
        }
        if (at_or_after != ordered.end()) {
            // Last of a run of equal timestamps
            int64_t after_ts = (*at_or_after)->timestampMs();
            OrderedReadings::const_iterator last = std::upper_bound(
                at_or_after, ordered.end(), after_ts,
                [](int64_t t, const Reading* r) { return t < r->timestampMs(); }) - 1;
            int64_t diff = after_ts - ts_ms;
            if (diff <= tolerance_ms && diff <= best_diff) {
                best = *last;
            }
        }
        return best;
    }
}

namespace Synchronizer {
    std::vector<std::string> sensorOrder(const SensorSeries& series) {
        std::vector<std::string> ids;
        ids.reserve(series.size());
        for (const SensorSeries::value_type& entry : series) {
            ids.push_back(entry.first);
        }
        return ids;
    }

    std::vector<SyncRow> align(const SensorSeries& series, int64_t tolerance_ms) {
        std::vector<SyncRow> rows;
        if (series.empty()) {
            return rows;
        }

        std::vector<int64_t> axis;
        std::vector<OrderedReadings> ordered;
        ordered.reserve(series.size());
        for (const SensorSeries::value_type& entry : series) {
            for (const Reading& r : entry.second) {
                axis.push_back(r.timestampMs());
            }
            ordered.push_back(orderByTime(entry.second));
        }
        std::sort(axis.begin(), axis.end());
        axis.erase(std::unique(axis.begin(), axis.end()), axis.end());

        rows.reserve(axis.size());
        for (int64_t ts : axis) {
            SyncRow row;
            row.ts_ms = ts;
            row.cells.reserve(ordered.size());
            for (const OrderedReadings& sensor : ordered) {
                row.cells.push_back(nearest(sensor, ts, tolerance_ms));
            }
            rows.push_back(row);
        }

        LOG_DEBUG(TAG, "Aligned %u sensors onto %u timestamps", static_cast<unsigned>(series.size()),
                  static_cast<unsigned>(rows.size()));
        return rows;
    }
}
