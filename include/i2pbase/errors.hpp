#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace i2pbase {

enum class ErrorKind { InvalidSymbol, InvalidLength, InvalidPadding, IOError };

const char* error_kind_name(ErrorKind kind);

// Printable characters come back quoted, anything else as 0xNN.
std::string describe_char(char c);

// Raised by the alphabet, the stream adapters and the codec.
class CodecError : public std::runtime_error {
public:
    static constexpr std::size_t kNoOffset = static_cast<std::size_t>(-1);

    CodecError(ErrorKind kind, const std::string& detail, std::size_t offset = kNoOffset);

    ErrorKind kind() const { return kind_; }
    bool has_offset() const { return offset_ != kNoOffset; }
    std::size_t offset() const { return offset_; }

private:
    ErrorKind kind_;
    std::size_t offset_;
};

}  // namespace i2pbase
