#pragma once

#include "nmea0183_decoder/parse_error.hpp"
#include "nmea0183_decoder/types.hpp"

#include <charconv>
#include <string>
#include <string_view>
#include <system_error>

namespace nmea0183_decoder {

bool isDigits(std::string_view text);

// Digit run parsed at the width of T. Signs, spaces and empty text are rejected.
template <typename T>
T parseInteger(std::string_view text, const char *field) {
    T value{};
    if (!isDigits(text)) {
        throw ParseError(ErrorKind::InvalidField,
                         std::string(field) + ": not a number '" + std::string(text) + "'");
    }
    auto res = std::from_chars(text.data(), text.data() + text.size(), value);
    if (res.ec != std::errc() || res.ptr != text.data() + text.size()) {
        throw ParseError(ErrorKind::InvalidField,
                         std::string(field) + ": number out of range '" + std::string(text) + "'");
    }
    return value;
}

double parseDouble(std::string_view text, const char *field);
float parseFloat(std::string_view text, const char *field);

// hhmmss[.sss]
TimeOfDay parseTimeOfDay(std::string_view text);

// ddmmyy
Date parseDate(std::string_view text);

// DDmm.mmm / DDDmm.mmm with a one letter hemisphere.
double parseLatitude(std::string_view value, std::string_view hemisphere);
double parseLongitude(std::string_view value, std::string_view hemisphere);

} // namespace nmea0183_decoder
