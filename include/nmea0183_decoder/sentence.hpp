#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace nmea0183_decoder {

// NMEA 3.01 allows 82 chars including "$" and "\r\n", but several receivers
// emit longer sentences (Trimble BX-960 GGA is 91, Skytraq S2525F8 PSTI is 100).
// Longer input is typically two sentences merged by a glitching receiver.
constexpr std::size_t kMaxSentenceLength = 102;

// Envelope of one sentence. All views point into the caller's input.
struct RawSentence {
    std::string_view talker_id;   // 2 bytes
    std::string_view message_id;  // 3 bytes
    std::string_view data;        // payload between the first ',' and '*'
    uint8_t checksum{0};          // declared checksum

    uint8_t calcChecksum() const;
};

uint8_t checksum(std::string_view bytes);

// Split "$TTMMM,payload*HH" into its parts. Throws ParseError on oversized or
// malformed input. The checksum is parsed but not verified here.
RawSentence parseSentence(std::string_view input);

} // namespace nmea0183_decoder
