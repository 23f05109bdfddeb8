#include <gtest/gtest.h>

#include <string>

#include "nmea0183_decoder/parse_error.hpp"
#include "nmea0183_decoder/sentence.hpp"

using namespace nmea0183_decoder;

static ErrorKind frameError(const std::string &line) {
    try {
        parseSentence(line);
    } catch (const ParseError &e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected ParseError for " << line;
    return ErrorKind::InvalidField;
}

TEST(Checksum, XorFold) {
    EXPECT_EQ(checksum(""), 0);
    EXPECT_EQ(checksum("A"), 'A');
    EXPECT_EQ(checksum("AA"), 0);
    EXPECT_EQ(checksum("GPGGA,,,,,,0,,,,,,,,"), 0x66);
}

TEST(ParseSentence, SplitsEnvelope) {
    RawSentence s = parseSentence("$GPRMC,225446.33,A,4916.45,N,12311.12,W,000.5,054.7,191194,020.3,E,A*2B");
    EXPECT_EQ(s.talker_id, "GP");
    EXPECT_EQ(s.message_id, "RMC");
    EXPECT_EQ(s.data, "225446.33,A,4916.45,N,12311.12,W,000.5,054.7,191194,020.3,E,A");
    EXPECT_EQ(s.checksum, 0x2B);
    EXPECT_EQ(s.calcChecksum(), 0x2B);
}

TEST(ParseSentence, LowercaseHexAndTrailingBytes) {
    RawSentence s = parseSentence("$GPGGA,133605.0,5521.75946,N,03731.93769,E,0,00,,,M,,M,,*4f\r\n");
    EXPECT_EQ(s.checksum, 0x4F);
    EXPECT_EQ(s.calcChecksum(), 0x4F);
}

TEST(ParseSentence, EmptyPayload) {
    RawSentence s = parseSentence("$GPGSA,*00");
    EXPECT_EQ(s.data, "");
    EXPECT_EQ(s.checksum, 0);
}

TEST(ParseSentence, Oversized) {
    std::string line = "$GPGSA,A,3," + std::string(100, ',') + "*00";
    ASSERT_GT(line.size(), kMaxSentenceLength);
    EXPECT_EQ(frameError(line), ErrorKind::Oversized);

    // Content does not matter, even garbage is rejected for its length.
    EXPECT_EQ(frameError(std::string(103, 'x')), ErrorKind::Oversized);

    std::string exact = "$GPGSA," + std::string(kMaxSentenceLength - 10, ',') + "*00";
    ASSERT_EQ(exact.size(), kMaxSentenceLength);
    EXPECT_NO_THROW(parseSentence(exact));
}

TEST(ParseSentence, Malformed) {
    EXPECT_EQ(frameError(""), ErrorKind::Malformed);
    EXPECT_EQ(frameError("GPGGA,,,,,,0,,,,,,,,*66"), ErrorKind::Malformed);
    EXPECT_EQ(frameError("$GPGG"), ErrorKind::Malformed);
    EXPECT_EQ(frameError("$PUBX,00,1*2E"), ErrorKind::Malformed);
    EXPECT_EQ(frameError("$GPGGA,,,,,,0,,,,,,,,"), ErrorKind::Malformed);
    EXPECT_EQ(frameError("$GPGGA,,,,,,0,,,,,,,,*6"), ErrorKind::Malformed);
}

TEST(ParseSentence, ChecksumHex) {
    EXPECT_EQ(frameError("$GPGGA,,,,,,0,,,,,,,,*G6"), ErrorKind::ChecksumHex);
    EXPECT_EQ(frameError("$GPGGA,,,,,,0,,,,,,,,*6 "), ErrorKind::ChecksumHex);
}

TEST(ParseSentence, PayloadEndsAtFirstStar) {
    RawSentence s = parseSentence("$GPTXT,a*12*34");
    EXPECT_EQ(s.data, "a");
    EXPECT_EQ(s.checksum, 0x12);
    EXPECT_THROW(parseSentence("$GPTXT,a*b"), ParseError);
}
