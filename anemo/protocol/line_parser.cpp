#include <anemo/protocol/line_parser.hpp>
#include <anemo/utils/logger.hpp>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>

static const char* TAG = "LINE_PARSER";

namespace {
    static constexpr std::size_t max_tokens = 64;
    static constexpr std::size_t max_token_len = 31;

    struct Token {
        const char* begin;
        std::size_t len;
    };

    static bool isSpace(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    // out_truncated is set when tokens beyond max_count were left unread
    static std::size_t tokenize(const char* line, Token* tokens, std::size_t max_count, bool& out_truncated) {
        std::size_t n = 0;
        const char* p = line;
        out_truncated = false;
        while (*p != '\0') {
            while (*p != '\0' && isSpace(*p)) {
                ++p;
            }
            if (*p == '\0') {
                break;
            }
            if (n == max_count) {
                out_truncated = true;
                break;
            }
            const char* start = p;
            while (*p != '\0' && !isSpace(*p)) {
                ++p;
            }
            tokens[n].begin = start;
            tokens[n].len = static_cast<std::size_t>(p - start);
            ++n;
        }
        return n;
    }

    // Whole token must be a finite number
    static bool parseNumber(const Token& tok, double& out_value) {
        if (tok.len == 0 || tok.len > max_token_len) {
            return false;
        }
        char buf[max_token_len + 1];
        std::memcpy(buf, tok.begin, tok.len);
        buf[tok.len] = '\0';
        char* end = nullptr;
        errno = 0;
        double v = std::strtod(buf, &end);
        if (end == buf || *end != '\0' || errno == ERANGE || !std::isfinite(v)) {
            return false;
        }
        out_value = v;
        return true;
    }

    // Upper-cased copy of a token if it is short enough to be a tag
    static bool upperTag(const Token& tok, char* out, std::size_t out_size) {
        if (tok.len == 0 || tok.len >= out_size) {
            return false;
        }
        for (std::size_t i = 0; i < tok.len; ++i) {
            out[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(tok.begin[i])));
        }
        out[tok.len] = '\0';
        return true;
    }

    // 1-2 uppercase ASCII letters
    static bool isTagShaped(const char* tag) {
        std::size_t len = std::strlen(tag);
        if (len < 1 || len > ParsedFields::max_tag_len) {
            return false;
        }
        for (std::size_t i = 0; i < len; ++i) {
            if (tag[i] < 'A' || tag[i] > 'Z') {
                return false;
            }
        }
        return true;
    }
}

namespace LineParser {
    ParseStatus parseLine(const char* line, ParsedFields& out) {
        out.clear();
        if (line == nullptr) {
            return ParseStatus::EMPTY_LINE;
        }

        Token tokens[max_tokens];
        bool truncated = false;
        std::size_t count = tokenize(line, tokens, max_tokens, truncated);
        if (count == 0) {
            return ParseStatus::EMPTY_LINE;
        }
        if (truncated) {
            LOG_WARN(TAG, "Line has more than %u tokens, ignoring the rest", static_cast<unsigned>(max_tokens));
        }

        std::size_t i = 0;
        while (i < count) {
            if (i + 1 < count) {
                char tag[ParsedFields::max_tag_len + 1];
                double value = 0.0;
                if (upperTag(tokens[i], tag, sizeof(tag)) && parseNumber(tokens[i + 1], value)) {
                    bool known = isKnownTag(tag);
                    if (known || isTagShaped(tag)) {
                        if (!out.set(tag, value)) {
                            LOG_WARN(TAG, "Field storage full, dropping %s", tag);
                        } else if (!known) {
                            LOG_DEBUG(TAG, "Unknown tag encountered: %s = %.3f", tag, value);
                        }
                        i += 2;
                        continue;
                    }
                }
            }
            // Not a tag/value pair; resynchronize on the next token
            ++i;
        }

        return out.empty() ? ParseStatus::NO_PAIRS : ParseStatus::OK;
    }

    bool validate(const ParsedFields& fields) {
        return firstMissingTag(fields) == nullptr;
    }

    const char* firstMissingTag(const ParsedFields& fields) {
        for (std::size_t i = 0; i < required_tag_count; ++i) {
            if (!fields.has(required_tags[i])) {
                return required_tags[i];
            }
        }
        return nullptr;
    }

    bool isErrorValue(double value) {
        for (double err : error_values) {
            if (std::fabs(value - err) < error_tolerance) {
                return true;
            }
        }
        return false;
    }

    bool hasErrorValues(const ParsedFields& fields) {
        for (std::size_t i = 0; i < fields.size(); ++i) {
            if (isErrorValue(fields.at(i).value)) {
                return true;
            }
        }
        return false;
    }

    bool isKnownTag(const char* tag) {
        if (tag == nullptr) {
            return false;
        }
        for (std::size_t i = 0; i < known_tag_count; ++i) {
            if (std::strcmp(known_tags[i], tag) == 0) {
                return true;
            }
        }
        return false;
    }

    bool looksLikeTelemetry(const char* line) {
        if (line == nullptr) {
            return false;
        }
        while (*line != '\0' && isSpace(*line)) {
            ++line;
        }
        return (line[0] == 'S' || line[0] == 's') && line[1] == ' ';
    }

    const char* statusName(ParseStatus status) {
        switch (status) {
            case ParseStatus::OK:         return "ok";
            case ParseStatus::EMPTY_LINE: return "empty line";
            case ParseStatus::NO_PAIRS:   return "no tag/value pairs";
        }
        return "unknown";
    }
}
