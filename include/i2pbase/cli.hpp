#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace i2pbase {

enum class Mode { Encode, Decode };

enum class InputKind { Stdin, File, Inline };

struct Options {
    Mode mode{Mode::Encode};
    InputKind input{InputKind::Stdin};
    std::string input_path;
    std::string inline_text;
    std::string output_path;  // empty: standard output
    bool ignore_whitespace{false};
    bool allow_unpadded{false};
};

// Parse CLI arguments; throws std::runtime_error on invalid usage.
Options parse_args(const std::vector<std::string>& args);

// Runs the selected operation. in and out stand for standard input and output.
void run(const Options& options, std::istream& in, std::ostream& out);

}  // namespace i2pbase
