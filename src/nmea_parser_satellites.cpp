#include "nmea0183_decoder/nmea_parser.hpp"
#include "nmea0183_decoder/field_cursor.hpp"

#include <string>

namespace nmea0183_decoder {

static std::optional<float> toFloat(std::optional<uint32_t> v) {
    if (!v) return std::nullopt;
    return static_cast<float>(*v);
}

// GL may be used for mixed GLONASS views and GN for GLONASS only views;
// receivers are inconsistent, both are reported as GLONASS.
GnssType NmeaParser::gnssTypeFromTalker(std::string_view talker_id) {
    if (talker_id == "GP") return GnssType::Gps;
    if (talker_id == "GL" || talker_id == "GN") return GnssType::Glonass;
    if (talker_id == "GA") return GnssType::Galileo;
    if (talker_id == "GB" || talker_id == "BD") return GnssType::Beidou;
    throw ParseError(ErrorKind::InvalidField,
                     "unknown GNSS talker id '" + std::string(talker_id) + "' in GSV sentence");
}

//------------------------- Parse GSV -------------------------
// $GPGSV,2,1,08,01,40,083,46,02,17,308,41,12,07,344,39,14,22,228,45*75
// sentences in group, sentence number, satellites in view, then up to four
// blocks of PRN, elevation, azimuth, SNR.
GsvData NmeaParser::parseGSV(const RawSentence &sentence) const {
    expectMessageId(sentence, "GSV");
    GnssType type = gnssTypeFromTalker(sentence.talker_id);
    FieldCursor f(sentence.data);
    GsvData d;

    d.gnss_type = type;
    d.number_of_sentences = f.requiredInteger<uint16_t>("number of sentences");
    d.sentence_num = f.requiredInteger<uint16_t>("sentence number");
    d.sats_in_view = f.requiredInteger<uint16_t>("satellites in view");

    for (auto &slot : d.sats_info) {
        std::string_view prn = f.nextOrEmpty();
        if (prn.empty()) break;

        Satellite sat;
        sat.gnss_type = type;
        sat.prn = parseInteger<uint32_t>(prn, "satellite prn");
        sat.elevation = toFloat(f.optionalInteger<uint32_t>("satellite elevation"));
        sat.azimuth = toFloat(f.optionalInteger<uint32_t>("satellite azimuth"));
        sat.snr = toFloat(f.optionalInteger<uint32_t>("satellite snr"));
        slot = sat;
    }
    return d;
}

//------------------------- Parse GSA -------------------------
// $GPGSA,A,3,,,,,,16,18,,22,24,,,3.6,2.1,2.2*3C
// Most receivers send 12 PRN fields but some send more (CH-4701 sends 24).
// NMEA 4.1 appends a system id after VDOP, it is ignored. A receiver without
// a fix may send only commas after the mode ("$GPGSA,A,1,,,,*32").
static constexpr std::size_t kGsaPrnSlots = 12;

GsaData NmeaParser::parseGSA(const RawSentence &sentence) const {
    expectMessageId(sentence, "GSA");
    FieldCursor f(sentence.data);
    GsaData d;

    d.mode1 = f.requiredChar("mode 1", "MA") == 'M' ? GsaMode1::Manual : GsaMode1::Automatic;
    switch (f.requiredChar("mode 2", "123")) {
    case '1': d.mode2 = GsaMode2::NoFix; break;
    case '2': d.mode2 = GsaMode2::Fix2D; break;
    default: d.mode2 = GsaMode2::Fix3D; break;
    }

    if (f.atEnd()) {
        throw ParseError(ErrorKind::InvalidField, "missing field: satellite prn");
    }
    if (f.restIsEmpty()) return d;

    if (f.remaining() == kGsaPrnSlots + 3 + 1) {
        // NMEA 4.1 layout: 12 PRN slots, PDOP, HDOP, VDOP, system id.
        for (std::size_t i = 0; i < kGsaPrnSlots; ++i) {
            std::string_view prn = f.next("satellite prn");
            if (!prn.empty()) d.fix_sats_prn.push_back(parseInteger<uint32_t>(prn, "satellite prn"));
        }
    } else {
        // PRN fields are empty or plain digits; the three DOP fields always follow.
        while (f.remaining() > 3) {
            std::string_view prn = f.peek();
            if (!prn.empty() && !isDigits(prn)) break;
            f.skip();
            if (!prn.empty()) d.fix_sats_prn.push_back(parseInteger<uint32_t>(prn, "satellite prn"));
        }
    }
    d.pdop = f.requiredFloat("pdop");
    d.hdop = f.requiredFloat("hdop");
    d.vdop = f.requiredFloat("vdop");
    return d;
}

} // namespace nmea0183_decoder
