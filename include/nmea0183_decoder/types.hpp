#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace nmea0183_decoder {

enum class GnssType {
    Gps,
    Glonass,
    Galileo,
    Beidou,
};

// GGA fix quality indicator, digit 0..8
enum class FixType {
    Invalid,
    Gps,
    DGps,
    Pps,
    Rtk,
    FloatRtk,
    Estimated,
    Manual,
    Simulation,
};

enum class RmcStatusOfFix {
    Autonomous,
    Differential,
    Invalid,
};

enum class GsaMode1 {
    Manual,
    Automatic,
};

enum class GsaMode2 {
    NoFix,
    Fix2D,
    Fix3D,
};

// Positioning system mode indicator (NMEA 2.3 and later)
enum class PosSystemIndicator {
    Autonomous,
    Differential,
    EstimatedMode,
    ManualInput,
    DataNotValid,
};

struct TimeOfDay {
    uint8_t hour{0};
    uint8_t minute{0};
    uint8_t second{0};
    uint32_t nanosecond{0};
};

// Year is the two-digit year as transmitted, no century is applied.
struct Date {
    uint8_t day{1};
    uint8_t month{1};
    uint8_t year{0};
};

struct LatLon {
    double latitude{0.0};
    double longitude{0.0};
};

struct Satellite {
    GnssType gnss_type{GnssType::Gps};
    uint32_t prn{0};
    std::optional<float> elevation;
    std::optional<float> azimuth;
    std::optional<float> snr;
};

struct GgaData {
    std::optional<TimeOfDay> fix_time;
    FixType fix_type{FixType::Invalid};
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<uint32_t> fix_satellites;
    std::optional<float> hdop;
    std::optional<float> altitude;
    std::optional<float> geoid_height;
};

struct RmcData {
    std::optional<TimeOfDay> fix_time;
    std::optional<Date> fix_date;
    RmcStatusOfFix status_of_fix{RmcStatusOfFix::Invalid};
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<float> speed_over_ground;
    std::optional<float> true_course;
};

struct GsvData {
    GnssType gnss_type{GnssType::Gps};
    uint16_t number_of_sentences{0};
    uint16_t sentence_num{0};
    uint16_t sats_in_view{0};
    std::array<std::optional<Satellite>, 4> sats_info;
};

struct GsaData {
    GsaMode1 mode1{GsaMode1::Automatic};
    GsaMode2 mode2{GsaMode2::NoFix};
    std::vector<uint32_t> fix_sats_prn;
    std::optional<float> pdop;
    std::optional<float> hdop;
    std::optional<float> vdop;
};

struct VtgData {
    std::optional<float> true_course;
    std::optional<float> speed_over_ground;  // knots
};

struct GllData {
    double latitude{0.0};
    double longitude{0.0};
    TimeOfDay fix_time;
    std::optional<PosSystemIndicator> mode;
};

// Well-formed sentence whose message id has no decoder here.
struct Unsupported {
    std::string message_id;
};

using ParseResult = std::variant<GgaData, RmcData, GsvData, GsaData, VtgData, GllData, Unsupported>;

bool operator==(const TimeOfDay &a, const TimeOfDay &b);
bool operator==(const Date &a, const Date &b);
bool operator==(const Satellite &a, const Satellite &b);
bool operator==(const GgaData &a, const GgaData &b);
bool operator==(const RmcData &a, const RmcData &b);
bool operator==(const GsvData &a, const GsvData &b);
bool operator==(const GsaData &a, const GsaData &b);
bool operator==(const VtgData &a, const VtgData &b);
bool operator==(const GllData &a, const GllData &b);
bool operator==(const Unsupported &a, const Unsupported &b);

const char *toString(GnssType type);
const char *toString(FixType type);

// Three-letter sentence kind of a decoded result ("GGA", ..., or the raw id).
std::string sentenceTypeName(const ParseResult &result);

} // namespace nmea0183_decoder
