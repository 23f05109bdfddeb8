#pragma once

#include "nmea0183_decoder/parse_error.hpp"
#include "nmea0183_decoder/sentence.hpp"
#include "nmea0183_decoder/types.hpp"

#include <string_view>

namespace nmea0183_decoder {

// Stateless: every call decodes its input from scratch, instances may be shared
// between threads.
class NmeaParser {
public:
    NmeaParser() = default;

    // Frame, verify the checksum and decode one sentence. Unknown message ids
    // yield Unsupported. Throws ParseError.
    ParseResult parse(std::string_view line) const;

    GgaData parseGGA(const RawSentence &sentence) const;
    RmcData parseRMC(const RawSentence &sentence) const;
    GsvData parseGSV(const RawSentence &sentence) const;
    GsaData parseGSA(const RawSentence &sentence) const;
    VtgData parseVTG(const RawSentence &sentence) const;
    GllData parseGLL(const RawSentence &sentence) const;

private:
    static void expectMessageId(const RawSentence &sentence, std::string_view id);
    static GnssType gnssTypeFromTalker(std::string_view talker_id);
};

} // namespace nmea0183_decoder
