#include "nmea0183_decoder/nmea_parser.hpp"
#include "nmea0183_decoder/field_cursor.hpp"

#include <cstdio>
#include <string>

namespace nmea0183_decoder {

//------------------------- Dispatcher -------------------------
ParseResult NmeaParser::parse(std::string_view line) const {
    RawSentence s = parseSentence(line);

    uint8_t calc = s.calcChecksum();
    if (calc != s.checksum) {
        char msg[64];
        std::snprintf(msg, sizeof(msg), "checksum mismatch: declared %02X, computed %02X",
                      static_cast<unsigned>(s.checksum), static_cast<unsigned>(calc));
        throw ParseError(ErrorKind::ChecksumMismatch, msg);
    }

    if (s.message_id == "GGA") return parseGGA(s);
    if (s.message_id == "RMC") return parseRMC(s);
    if (s.message_id == "GSV") return parseGSV(s);
    if (s.message_id == "GSA") return parseGSA(s);
    if (s.message_id == "VTG") return parseVTG(s);
    if (s.message_id == "GLL") return parseGLL(s);
    return Unsupported{std::string(s.message_id)};
}

void NmeaParser::expectMessageId(const RawSentence &sentence, std::string_view id) {
    if (sentence.message_id != id) {
        throw ParseError(ErrorKind::MessageIdMismatch,
                         std::string(id) + " decoder called on $" + std::string(sentence.talker_id) +
                         std::string(sentence.message_id) + " sentence");
    }
}

//------------------------- Parse GGA -------------------------
// $GPGGA,123519,4807.038,N,01131.324,E,1,08,0.9,545.4,M,46.9,M,,*47
// time, lat, N/S, lon, E/W, quality, satellites, hdop, altitude, M, geoid height, M,
// then DGPS age and station id which are not decoded.
GgaData NmeaParser::parseGGA(const RawSentence &sentence) const {
    expectMessageId(sentence, "GGA");
    FieldCursor f(sentence.data);
    GgaData d;

    d.fix_time = f.optionalTime();
    if (auto pos = f.optionalLatLon()) {
        d.latitude = pos->latitude;
        d.longitude = pos->longitude;
    }
    d.fix_type = static_cast<FixType>(f.requiredChar("fix quality", "012345678") - '0');
    d.fix_satellites = f.optionalInteger<uint32_t>("satellites");
    d.hdop = f.optionalFloat("hdop");
    d.altitude = f.optionalFloat("altitude");
    f.next("altitude unit");
    d.geoid_height = f.optionalFloat("geoid height");
    f.next("geoid height unit");
    return d;
}

//------------------------- Parse RMC -------------------------
// $GPRMC,225446.33,A,4916.45,N,12311.12,W,000.5,054.7,191194,020.3,E,A*2B
// Magnetic variation and the FAA mode indicator are not decoded; SiRF chips
// leave them out entirely.
RmcData NmeaParser::parseRMC(const RawSentence &sentence) const {
    expectMessageId(sentence, "RMC");
    FieldCursor f(sentence.data);
    RmcData d;

    d.fix_time = f.optionalTime();
    switch (f.requiredChar("status", "ADV")) {
    case 'A': d.status_of_fix = RmcStatusOfFix::Autonomous; break;
    case 'D': d.status_of_fix = RmcStatusOfFix::Differential; break;
    default: d.status_of_fix = RmcStatusOfFix::Invalid; break;
    }
    if (auto pos = f.optionalLatLon()) {
        d.latitude = pos->latitude;
        d.longitude = pos->longitude;
    }
    d.speed_over_ground = f.optionalFloat("speed over ground");
    d.true_course = f.optionalFloat("true course");
    if (f.atEnd()) {
        throw ParseError(ErrorKind::InvalidField, "missing field: date");
    }
    d.fix_date = f.optionalDate();
    return d;
}

//------------------------- Parse VTG -------------------------
// $GPVTG,054.7,T,034.4,M,005.5,N,010.2,K*48
VtgData NmeaParser::parseVTG(const RawSentence &sentence) const {
    expectMessageId(sentence, "VTG");
    FieldCursor f(sentence.data);
    VtgData d;

    d.true_course = f.optionalFloat("true course");
    f.next("true course unit");
    f.optionalFloat("magnetic course");
    f.next("magnetic course unit");
    auto knots = f.optionalFloat("speed knots");
    f.next("speed knots unit");
    auto kph = f.optionalFloat("speed km/h");
    f.next("speed km/h unit");

    if (knots) {
        d.speed_over_ground = knots;
    } else if (kph) {
        d.speed_over_ground = *kph / 1.852f;
    }
    return d;
}

//------------------------- Parse GLL -------------------------
// $GPGLL,4916.45,N,12311.12,W,225444,A,A*5C
// Only sentences flagged 'A' (data valid) are accepted.
GllData NmeaParser::parseGLL(const RawSentence &sentence) const {
    expectMessageId(sentence, "GLL");
    FieldCursor f(sentence.data);
    GllData d;

    LatLon pos = f.requiredLatLon();
    d.latitude = pos.latitude;
    d.longitude = pos.longitude;
    d.fix_time = f.requiredTime();

    std::string_view status = f.next("status");
    if (status != "A") {
        throw ParseError(ErrorKind::InvalidField,
                         "status: position not valid '" + std::string(status) + "'");
    }

    std::string_view mode = f.nextOrEmpty();
    if (!mode.empty()) {
        switch (mode.size() == 1 ? mode[0] : '\0') {
        case 'A': d.mode = PosSystemIndicator::Autonomous; break;
        case 'D': d.mode = PosSystemIndicator::Differential; break;
        case 'E': d.mode = PosSystemIndicator::EstimatedMode; break;
        case 'M': d.mode = PosSystemIndicator::ManualInput; break;
        default: d.mode = PosSystemIndicator::DataNotValid; break;
        }
    }
    return d;
}

} // namespace nmea0183_decoder
