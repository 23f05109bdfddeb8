#include "nmea0183_decoder/types.hpp"

namespace nmea0183_decoder {

bool operator==(const TimeOfDay &a, const TimeOfDay &b) {
    return a.hour == b.hour && a.minute == b.minute && a.second == b.second &&
           a.nanosecond == b.nanosecond;
}

bool operator==(const Date &a, const Date &b) {
    return a.day == b.day && a.month == b.month && a.year == b.year;
}

bool operator==(const Satellite &a, const Satellite &b) {
    return a.gnss_type == b.gnss_type && a.prn == b.prn && a.elevation == b.elevation &&
           a.azimuth == b.azimuth && a.snr == b.snr;
}

bool operator==(const GgaData &a, const GgaData &b) {
    return a.fix_time == b.fix_time && a.fix_type == b.fix_type && a.latitude == b.latitude &&
           a.longitude == b.longitude && a.fix_satellites == b.fix_satellites &&
           a.hdop == b.hdop && a.altitude == b.altitude && a.geoid_height == b.geoid_height;
}

bool operator==(const RmcData &a, const RmcData &b) {
    return a.fix_time == b.fix_time && a.fix_date == b.fix_date &&
           a.status_of_fix == b.status_of_fix && a.latitude == b.latitude &&
           a.longitude == b.longitude && a.speed_over_ground == b.speed_over_ground &&
           a.true_course == b.true_course;
}

bool operator==(const GsvData &a, const GsvData &b) {
    return a.gnss_type == b.gnss_type && a.number_of_sentences == b.number_of_sentences &&
           a.sentence_num == b.sentence_num && a.sats_in_view == b.sats_in_view &&
           a.sats_info == b.sats_info;
}

bool operator==(const GsaData &a, const GsaData &b) {
    return a.mode1 == b.mode1 && a.mode2 == b.mode2 && a.fix_sats_prn == b.fix_sats_prn &&
           a.pdop == b.pdop && a.hdop == b.hdop && a.vdop == b.vdop;
}

bool operator==(const VtgData &a, const VtgData &b) {
    return a.true_course == b.true_course && a.speed_over_ground == b.speed_over_ground;
}

bool operator==(const GllData &a, const GllData &b) {
    return a.latitude == b.latitude && a.longitude == b.longitude &&
           a.fix_time == b.fix_time && a.mode == b.mode;
}

bool operator==(const Unsupported &a, const Unsupported &b) {
    return a.message_id == b.message_id;
}

const char *toString(GnssType type) {
    switch (type) {
    case GnssType::Gps: return "GPS";
    case GnssType::Glonass: return "GLONASS";
    case GnssType::Galileo: return "Galileo";
    case GnssType::Beidou: return "BeiDou";
    }
    return "unknown";
}

const char *toString(FixType type) {
    switch (type) {
    case FixType::Invalid: return "invalid";
    case FixType::Gps: return "GPS";
    case FixType::DGps: return "DGPS";
    case FixType::Pps: return "PPS";
    case FixType::Rtk: return "RTK";
    case FixType::FloatRtk: return "float RTK";
    case FixType::Estimated: return "estimated";
    case FixType::Manual: return "manual";
    case FixType::Simulation: return "simulation";
    }
    return "unknown";
}

namespace {

struct SentenceTypeNameVisitor {
    std::string operator()(const GgaData &) const { return "GGA"; }
    std::string operator()(const RmcData &) const { return "RMC"; }
    std::string operator()(const GsvData &) const { return "GSV"; }
    std::string operator()(const GsaData &) const { return "GSA"; }
    std::string operator()(const VtgData &) const { return "VTG"; }
    std::string operator()(const GllData &) const { return "GLL"; }
    std::string operator()(const Unsupported &u) const { return u.message_id; }
};

} // namespace

std::string sentenceTypeName(const ParseResult &result) {
    return std::visit(SentenceTypeNameVisitor{}, result);
}

} // namespace nmea0183_decoder
