#pragma once

#include <stdexcept>
#include <string>

namespace nmea0183_decoder {

enum class ErrorKind {
    Oversized,          // input longer than kMaxSentenceLength
    Malformed,          // missing '$' / '*', truncated ids or checksum
    ChecksumHex,        // checksum suffix is not two hex digits
    ChecksumMismatch,
    MessageIdMismatch,  // type decoder called on another sentence kind
    InvalidField,       // grammar violation inside a sentence payload
};

const char *toString(ErrorKind kind);

class ParseError : public std::runtime_error {
public:
    ParseError(ErrorKind kind, const std::string &what);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace nmea0183_decoder
