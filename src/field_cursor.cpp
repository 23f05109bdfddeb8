#include "nmea0183_decoder/field_cursor.hpp"

#include <algorithm>
#include <string>

namespace nmea0183_decoder {

FieldCursor::FieldCursor(std::string_view payload)
: payload_(payload)
{
}

std::size_t FieldCursor::remaining() const {
    if (done_) return 0;
    std::string_view rest = payload_.substr(pos_);
    return static_cast<std::size_t>(std::count(rest.begin(), rest.end(), ',')) + 1;
}

std::string_view FieldCursor::nextOrEmpty() {
    if (done_) return {};
    auto comma = payload_.find(',', pos_);
    std::string_view field;
    if (comma == std::string_view::npos) {
        field = payload_.substr(pos_);
        pos_ = payload_.size();
        done_ = true;
    } else {
        field = payload_.substr(pos_, comma - pos_);
        pos_ = comma + 1;
    }
    return field;
}

std::string_view FieldCursor::next(const char *field) {
    if (done_) {
        throw ParseError(ErrorKind::InvalidField, std::string("missing field: ") + field);
    }
    return nextOrEmpty();
}

std::string_view FieldCursor::peek() const {
    if (done_) return {};
    auto comma = payload_.find(',', pos_);
    if (comma == std::string_view::npos) return payload_.substr(pos_);
    return payload_.substr(pos_, comma - pos_);
}

void FieldCursor::skip(std::size_t count) {
    for (std::size_t i = 0; i < count; ++i) nextOrEmpty();
}

bool FieldCursor::restIsEmpty() const {
    if (done_) return true;
    std::string_view rest = payload_.substr(pos_);
    return std::all_of(rest.begin(), rest.end(), [](char ch) { return ch == ','; });
}

float FieldCursor::requiredFloat(const char *field) {
    return parseFloat(next(field), field);
}

std::optional<float> FieldCursor::optionalFloat(const char *field) {
    std::string_view text = nextOrEmpty();
    if (text.empty()) return std::nullopt;
    return parseFloat(text, field);
}

char FieldCursor::requiredChar(const char *field, std::string_view allowed) {
    std::string_view text = next(field);
    if (text.size() != 1 || allowed.find(text[0]) == std::string_view::npos) {
        throw ParseError(ErrorKind::InvalidField,
                         std::string(field) + ": expected one of '" + std::string(allowed) +
                         "', got '" + std::string(text) + "'");
    }
    return text[0];
}

TimeOfDay FieldCursor::requiredTime() {
    return parseTimeOfDay(next("time"));
}

std::optional<TimeOfDay> FieldCursor::optionalTime() {
    std::string_view text = nextOrEmpty();
    if (text.empty()) return std::nullopt;
    return parseTimeOfDay(text);
}

std::optional<Date> FieldCursor::optionalDate() {
    std::string_view text = nextOrEmpty();
    if (text.empty()) return std::nullopt;
    return parseDate(text);
}

LatLon FieldCursor::requiredLatLon() {
    std::string_view lat = next("latitude");
    std::string_view ns = next("latitude hemisphere");
    std::string_view lon = next("longitude");
    std::string_view ew = next("longitude hemisphere");
    return LatLon{parseLatitude(lat, ns), parseLongitude(lon, ew)};
}

std::optional<LatLon> FieldCursor::optionalLatLon() {
    std::string_view lat = nextOrEmpty();
    std::string_view ns = nextOrEmpty();
    std::string_view lon = nextOrEmpty();
    std::string_view ew = nextOrEmpty();
    // ",,," is how receivers report "no fix"
    if (lat.empty() && ns.empty() && lon.empty() && ew.empty()) return std::nullopt;
    return LatLon{parseLatitude(lat, ns), parseLongitude(lon, ew)};
}

} // namespace nmea0183_decoder
