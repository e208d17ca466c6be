#ifndef PARSED_FIELDS_HPP
#define PARSED_FIELDS_HPP

#include <array>
#include <cstddef>
#include <cstring>

// Tag -> value pairs taken from one telemetry line. Fixed storage; a repeated tag
// keeps its last value.
class ParsedFields {
public:
    static constexpr std::size_t max_fields = 24;
    static constexpr std::size_t max_tag_len = 2;

    struct Field {
        char  tag[max_tag_len + 1];
        double value;
    };

    ParsedFields() : field_count(0) {}

    // Returns false when tag is too long or storage is exhausted.
    bool set(const char* tag, double value) {
        if (tag == nullptr || tag[0] == '\0' || std::strlen(tag) > max_tag_len) {
            return false;
        }
        for (std::size_t i = 0; i < field_count; ++i) {
            if (std::strcmp(fields[i].tag, tag) == 0) {
                fields[i].value = value;
                return true;
            }
        }
        if (field_count == max_fields) {
            return false;
        }
        std::strncpy(fields[field_count].tag, tag, max_tag_len);
        fields[field_count].tag[max_tag_len] = '\0';
        fields[field_count].value = value;
        ++field_count;
        return true;
    }

    bool get(const char* tag, double& out_value) const {
        for (std::size_t i = 0; i < field_count; ++i) {
            if (std::strcmp(fields[i].tag, tag) == 0) {
                out_value = fields[i].value;
                return true;
            }
        }
        return false;
    }

    bool has(const char* tag) const {
        double unused = 0.0;
        return get(tag, unused);
    }

    double getOr(const char* tag, double fallback) const {
        double v = fallback;
        return get(tag, v) ? v : fallback;
    }

    std::size_t size() const { return field_count; }
    bool empty() const { return field_count == 0; }
    const Field& at(std::size_t index) const { return fields[index]; }

    void clear() { field_count = 0; }

private:
    std::array<Field, max_fields> fields;
    std::size_t field_count;
};

#endif // PARSED_FIELDS_HPP
