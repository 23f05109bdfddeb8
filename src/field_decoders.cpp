#include "nmea0183_decoder/field_decoders.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace nmea0183_decoder {

bool isDigits(std::string_view text) {
    if (text.empty()) return false;
    for (char ch : text) {
        if (ch < '0' || ch > '9') return false;
    }
    return true;
}

//------------------------- Real numbers -------------------------
double parseDouble(std::string_view text, const char *field) {
    // strtod also takes "inf", "nan", hex floats and leading blanks; NMEA never does.
    bool has_digit = false;
    for (char ch : text) {
        if (ch >= '0' && ch <= '9') {
            has_digit = true;
        } else if (ch != '+' && ch != '-' && ch != '.' && ch != 'e' && ch != 'E') {
            has_digit = false;
            break;
        }
    }
    std::string buf(text);
    if (!has_digit) {
        throw ParseError(ErrorKind::InvalidField,
                         std::string(field) + ": not a real number '" + buf + "'");
    }

    char *end = nullptr;
    errno = 0;
    double value = std::strtod(buf.c_str(), &end);
    if (end != buf.c_str() + buf.size() || errno == ERANGE) {
        throw ParseError(ErrorKind::InvalidField,
                         std::string(field) + ": not a real number '" + buf + "'");
    }
    return value;
}

float parseFloat(std::string_view text, const char *field) {
    return static_cast<float>(parseDouble(text, field));
}

//------------------------- Time of day -------------------------
TimeOfDay parseTimeOfDay(std::string_view text) {
    if (text.size() < 5) {
        throw ParseError(ErrorKind::InvalidField, "time: too short '" + std::string(text) + "'");
    }
    auto hour = parseInteger<uint8_t>(text.substr(0, 2), "time hour");
    auto minute = parseInteger<uint8_t>(text.substr(2, 2), "time minute");
    double seconds = parseDouble(text.substr(4), "time seconds");

    if (std::signbit(seconds)) {
        throw ParseError(ErrorKind::InvalidField, "time: second is negative");
    }
    if (hour >= 24) {
        throw ParseError(ErrorKind::InvalidField, "time: hour >= 24");
    }
    if (minute >= 60) {
        throw ParseError(ErrorKind::InvalidField, "time: minute >= 60");
    }
    if (seconds >= 60.0) {
        throw ParseError(ErrorKind::InvalidField, "time: second >= 60");
    }

    double whole = std::trunc(seconds);
    auto nanos = static_cast<uint32_t>(std::llround((seconds - whole) * 1e9));
    if (nanos > 999999999u) nanos = 999999999u;

    TimeOfDay t;
    t.hour = hour;
    t.minute = minute;
    t.second = static_cast<uint8_t>(whole);
    t.nanosecond = nanos;
    return t;
}

//------------------------- Calendar date -------------------------
Date parseDate(std::string_view text) {
    if (text.size() != 6) {
        throw ParseError(ErrorKind::InvalidField, "date: expected ddmmyy '" + std::string(text) + "'");
    }
    Date d;
    d.day = parseInteger<uint8_t>(text.substr(0, 2), "date day");
    d.month = parseInteger<uint8_t>(text.substr(2, 2), "date month");
    d.year = parseInteger<uint8_t>(text.substr(4, 2), "date year");

    // No per-month or leap year check.
    if (d.month < 1 || d.month > 12) {
        throw ParseError(ErrorKind::InvalidField, "date: month < 1 or > 12");
    }
    if (d.day < 1 || d.day > 31) {
        throw ParseError(ErrorKind::InvalidField, "date: day < 1 or > 31");
    }
    return d;
}

//------------------------- NMEA → Degrees -------------------------
static double nmeaToDeg(std::string_view value, std::size_t deg_len, const char *field) {
    if (value.size() <= deg_len) {
        throw ParseError(ErrorKind::InvalidField,
                         std::string(field) + ": too short '" + std::string(value) + "'");
    }
    auto deg = parseInteger<uint8_t>(value.substr(0, deg_len), field);
    std::string_view minutes = value.substr(deg_len);
    if (minutes[0] < '0' || minutes[0] > '9') {
        throw ParseError(ErrorKind::InvalidField,
                         std::string(field) + ": bad minutes '" + std::string(value) + "'");
    }
    return static_cast<double>(deg) + parseDouble(minutes, field) / 60.0;
}

double parseLatitude(std::string_view value, std::string_view hemisphere) {
    double lat = nmeaToDeg(value, 2, "latitude");
    if (hemisphere == "S") return -lat;
    if (hemisphere != "N") {
        throw ParseError(ErrorKind::InvalidField,
                         "latitude: hemisphere must be N or S, got '" + std::string(hemisphere) + "'");
    }
    return lat;
}

double parseLongitude(std::string_view value, std::string_view hemisphere) {
    double lon = nmeaToDeg(value, 3, "longitude");
    if (hemisphere == "W") return -lon;
    if (hemisphere != "E") {
        throw ParseError(ErrorKind::InvalidField,
                         "longitude: hemisphere must be E or W, got '" + std::string(hemisphere) + "'");
    }
    return lon;
}

} // namespace nmea0183_decoder
