// Parser for tagged anemometer telemetry lines, e.g.
//   "S  09.89 D  134 U -04.52 V  04.36 W -07.64 T  27.96 PI  02.1 RO -01.3"
#ifndef LINE_PARSER_HPP
#define LINE_PARSER_HPP

#include <anemo/models/parsed_fields.hpp>
#include <cstddef>
#include <cstdint>

namespace LineParser {
    // Channel tags
    static constexpr const char* TAG_SPEED      = "S";
    static constexpr const char* TAG_DIRECTION  = "D";
    static constexpr const char* TAG_VERT_DIR   = "DV";
    static constexpr const char* TAG_U          = "U";
    static constexpr const char* TAG_V          = "V";
    static constexpr const char* TAG_W          = "W";
    static constexpr const char* TAG_TEMP       = "T";
    static constexpr const char* TAG_PITCH      = "PI";
    static constexpr const char* TAG_ROLL       = "RO";

    static constexpr std::size_t known_tag_count = 9;
    static constexpr const char* known_tags[known_tag_count] = {
        TAG_SPEED, TAG_DIRECTION, TAG_VERT_DIR, TAG_U, TAG_V, TAG_W, TAG_TEMP, TAG_PITCH, TAG_ROLL
    };

    static constexpr std::size_t required_tag_count = 6;
    static constexpr const char* required_tags[required_tag_count] = {
        TAG_SPEED, TAG_DIRECTION, TAG_U, TAG_V, TAG_W, TAG_TEMP
    };

    // Sentinels the sensor emits for a channel it cannot measure
    static constexpr double error_values[2] = { -99.9, -99.99 };
    static constexpr double error_tolerance = 0.001;

    enum class ParseStatus : uint8_t {
        OK = 0,
        EMPTY_LINE = 1,   // null, empty or whitespace only
        NO_PAIRS = 2,     // tokens present but no tag/value pair found
    };

    // Parses one line into out (cleared first). Tokens that do not start a
    // tag/value pair are skipped one at a time; tag-shaped unknown tags are kept.
    ParseStatus parseLine(const char* line, ParsedFields& out);

    // True if all required channels are present
    bool validate(const ParsedFields& fields);

    // Name of the first missing required tag, or nullptr
    const char* firstMissingTag(const ParsedFields& fields);

    bool isErrorValue(double value);
    bool hasErrorValues(const ParsedFields& fields);

    bool isKnownTag(const char* tag);

    // Whole line looks like telemetry ("S " prefix, either case)
    bool looksLikeTelemetry(const char* line);

    const char* statusName(ParseStatus status);
}

#endif // LINE_PARSER_HPP
