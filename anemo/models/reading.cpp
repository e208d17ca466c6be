#include <anemo/models/reading.hpp>
#include <anemo/protocol/line_parser.hpp>
#include <cstring>

Reading::Reading()
    : ts_ms(0),
      speed_2d(0.0),
      dir(0.0),
      u(0.0),
      v(0.0),
      w(0.0),
      temp_c(0.0),
      pitch_deg(0.0),
      roll_deg(0.0),
      valid(false) {
    sensor_id[0] = '\0';
}

bool Reading::fromFields(const char* sensor_id, const ParsedFields& fields, int64_t ts_ms, Reading& out) {
    if (sensor_id == nullptr || sensor_id[0] == '\0' ||
        std::strlen(sensor_id) > Config::Sensors::id_max_len) {
        return false;
    }
    if (!LineParser::validate(fields)) {
        return false;
    }

    Reading r;
    r.ts_ms = ts_ms;
    std::strncpy(r.sensor_id, sensor_id, Config::Sensors::id_max_len);
    r.sensor_id[Config::Sensors::id_max_len] = '\0';
    r.speed_2d  = fields.getOr(LineParser::TAG_SPEED, 0.0);
    r.dir       = fields.getOr(LineParser::TAG_DIRECTION, 0.0);
    r.u         = fields.getOr(LineParser::TAG_U, 0.0);
    r.v         = fields.getOr(LineParser::TAG_V, 0.0);
    r.w         = fields.getOr(LineParser::TAG_W, 0.0);
    r.temp_c    = fields.getOr(LineParser::TAG_TEMP, 0.0);
    r.pitch_deg = fields.getOr(LineParser::TAG_PITCH, 0.0);
    r.roll_deg  = fields.getOr(LineParser::TAG_ROLL, 0.0);

    // Only the eight stored channels decide validity
    const double channels[] = { r.speed_2d, r.dir, r.u, r.v, r.w, r.temp_c, r.pitch_deg, r.roll_deg };
    r.valid = true;
    for (double c : channels) {
        if (LineParser::isErrorValue(c)) {
            r.valid = false;
            break;
        }
    }

    out = r;
    return true;
}
