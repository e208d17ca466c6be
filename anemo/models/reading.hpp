#ifndef READING_HPP
#define READING_HPP

#include <anemo/config/config.hpp>
#include <anemo/models/parsed_fields.hpp>
#include <cstdint>

// One anemometer sample. Built once from a validated field map; there are no
// setters, and is_valid is derived from the error sentinels at construction.
class Reading {
public:
    Reading();

    // Returns false (out untouched) if sensor_id is empty/too long or a required
    // channel is missing. PI and RO default to 0.0 when absent.
    static bool fromFields(const char* sensor_id, const ParsedFields& fields, int64_t ts_ms, Reading& out);

    int64_t timestampMs() const { return ts_ms; }
    const char* sensorId() const { return sensor_id; }

    double speed2d() const     { return speed_2d; }     // S
    double direction() const   { return dir; }          // D
    double uComponent() const  { return u; }            // U
    double vComponent() const  { return v; }            // V
    double wComponent() const  { return w; }            // W
    double temperature() const { return temp_c; }       // T
    double pitch() const       { return pitch_deg; }    // PI
    double roll() const        { return roll_deg; }     // RO

    bool isValid() const { return valid; }

private:
    int64_t ts_ms;  // receipt time, ms since epoch
    char    sensor_id[Config::Sensors::id_max_len + 1];
    double   speed_2d;
    double   dir;
    double   u;
    double   v;
    double   w;
    double   temp_c;
    double   pitch_deg;
    double   roll_deg;
    bool    valid;
};

#endif // READING_HPP
