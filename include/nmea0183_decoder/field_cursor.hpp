#pragma once

#include "nmea0183_decoder/field_decoders.hpp"
#include "nmea0183_decoder/types.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace nmea0183_decoder {

/**
 * Walks the comma separated fields of a sentence payload from left to right.
 *
 * "a,,b," holds four fields: "a", "", "b" and "". A missing field (past the
 * end of the payload) is a grammar violation for required reads and reads as
 * empty for optional ones.
 */
class FieldCursor {
public:
    explicit FieldCursor(std::string_view payload);

    // Fields not consumed yet.
    std::size_t remaining() const;
    bool atEnd() const { return done_; }

    std::string_view next(const char *field);
    std::string_view nextOrEmpty();
    std::string_view peek() const;
    void skip(std::size_t count = 1);

    // True when every field left is empty (also true at the end).
    bool restIsEmpty() const;

    template <typename T>
    T requiredInteger(const char *field) {
        return parseInteger<T>(next(field), field);
    }

    template <typename T>
    std::optional<T> optionalInteger(const char *field) {
        std::string_view text = nextOrEmpty();
        if (text.empty()) return std::nullopt;
        return parseInteger<T>(text, field);
    }

    float requiredFloat(const char *field);
    std::optional<float> optionalFloat(const char *field);

    // Single character field restricted to `allowed`.
    char requiredChar(const char *field, std::string_view allowed);

    TimeOfDay requiredTime();
    std::optional<TimeOfDay> optionalTime();
    std::optional<Date> optionalDate();

    // Four fields: lat, N/S, lon, E/W. optionalLatLon() maps ",,," to nullopt.
    LatLon requiredLatLon();
    std::optional<LatLon> optionalLatLon();

private:
    std::string_view payload_;
    std::size_t pos_{0};
    bool done_{false};
};

} // namespace nmea0183_decoder
