#include "i2pbase/errors.hpp"

#include <cstdio>
#include <string>

namespace i2pbase {

namespace {

std::string format_message(ErrorKind kind, const std::string& detail, std::size_t offset) {
    std::string message = error_kind_name(kind);
    message += ": ";
    message += detail;
    if (offset != CodecError::kNoOffset) {
        message += " at offset " + std::to_string(offset);
    }
    return message;
}

}  // namespace

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidSymbol:
            return "InvalidSymbol";
        case ErrorKind::InvalidLength:
            return "InvalidLength";
        case ErrorKind::InvalidPadding:
            return "InvalidPadding";
        case ErrorKind::IOError:
            return "IOError";
    }
    return "UnknownError";
}

std::string describe_char(char c) {
    char text[16];
    const auto byte = static_cast<unsigned char>(c);
    if (byte >= 0x21 && byte < 0x7f) {
        std::snprintf(text, sizeof(text), "'%c'", c);
    } else {
        std::snprintf(text, sizeof(text), "0x%02X", byte);
    }
    return text;
}

CodecError::CodecError(ErrorKind kind, const std::string& detail, std::size_t offset)
    : std::runtime_error(format_message(kind, detail, offset)), kind_(kind), offset_(offset) {}

}  // namespace i2pbase
