#include "nmea0183_decoder/parse_error.hpp"

namespace nmea0183_decoder {

const char *toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Oversized: return "oversized";
    case ErrorKind::Malformed: return "malformed";
    case ErrorKind::ChecksumHex: return "checksum_hex";
    case ErrorKind::ChecksumMismatch: return "checksum_mismatch";
    case ErrorKind::MessageIdMismatch: return "message_id_mismatch";
    case ErrorKind::InvalidField: return "invalid_field";
    }
    return "unknown";
}

ParseError::ParseError(ErrorKind kind, const std::string &what)
: std::runtime_error(what), kind_(kind)
{
}

} // namespace nmea0183_decoder
