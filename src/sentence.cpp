#include "nmea0183_decoder/sentence.hpp"
#include "nmea0183_decoder/parse_error.hpp"

#include <string>

namespace nmea0183_decoder {

//------------------------- Checksum -------------------------
uint8_t checksum(std::string_view bytes) {
    uint8_t c = 0;
    for (char ch : bytes) c ^= static_cast<uint8_t>(ch);
    return c;
}

uint8_t RawSentence::calcChecksum() const {
    // Qualified: the member 'checksum' hides the free function here.
    return nmea0183_decoder::checksum(talker_id) ^ nmea0183_decoder::checksum(message_id) ^
           static_cast<uint8_t>(',') ^ nmea0183_decoder::checksum(data);
}

//------------------------- Hex digit -------------------------
static int hexValue(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    return -1;
}

//------------------------- Framer -------------------------
RawSentence parseSentence(std::string_view input) {
    if (input.size() > kMaxSentenceLength) {
        throw ParseError(ErrorKind::Oversized,
                         "sentence too long: " + std::to_string(input.size()) + " bytes");
    }
    if (input.empty() || input[0] != '$') {
        throw ParseError(ErrorKind::Malformed, "sentence does not start with '$'");
    }
    // '$' + talker(2) + message id(3) + ','
    if (input.size() < 7) {
        throw ParseError(ErrorKind::Malformed, "sentence header truncated");
    }
    if (input[6] != ',') {
        throw ParseError(ErrorKind::Malformed, "expected ',' after message id");
    }

    RawSentence s;
    s.talker_id = input.substr(1, 2);
    s.message_id = input.substr(3, 3);

    std::string_view rest = input.substr(7);
    auto star = rest.find('*');
    if (star == std::string_view::npos) {
        throw ParseError(ErrorKind::Malformed, "missing '*' checksum delimiter");
    }
    s.data = rest.substr(0, star);

    std::string_view hex = rest.substr(star + 1);
    if (hex.size() < 2) {
        throw ParseError(ErrorKind::Malformed, "checksum truncated");
    }
    int hi = hexValue(hex[0]);
    int lo = hexValue(hex[1]);
    if (hi < 0 || lo < 0) {
        throw ParseError(ErrorKind::ChecksumHex,
                         "checksum is not a hex number: '" + std::string(hex.substr(0, 2)) + "'");
    }
    s.checksum = static_cast<uint8_t>((hi << 4) | lo);
    return s;
}

} // namespace nmea0183_decoder
