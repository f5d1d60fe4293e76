#include "i2pbase/cli.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <utility>
#include <vector>

#include "i2pbase/errors.hpp"

using i2pbase::InputKind;
using i2pbase::Mode;
using i2pbase::Options;
using i2pbase::parse_args;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// Serves a prefix, then fails the way an unreadable standard input does.
class BrokenInputBuf : public std::streambuf {
public:
    explicit BrokenInputBuf(std::string prefix) : prefix_(std::move(prefix)) {
        setg(&prefix_[0], &prefix_[0], &prefix_[0] + prefix_.size());
    }

protected:
    int_type underflow() override { throw std::runtime_error("read failed"); }

private:
    std::string prefix_;
};

}  // namespace

TEST(ParseArgsTest, DefaultsToStandardStreams) {
    const Options opts = parse_args({"encode"});
    EXPECT_EQ(opts.mode, Mode::Encode);
    EXPECT_EQ(opts.input, InputKind::Stdin);
    EXPECT_TRUE(opts.output_path.empty());
    EXPECT_FALSE(opts.ignore_whitespace);
    EXPECT_FALSE(opts.allow_unpadded);
}

TEST(ParseArgsTest, DecodeWithFileAndFlags) {
    const Options opts = parse_args({"decode", "-i", "in.b64", "--output", "out.bin", "-w", "--allow-unpadded"});
    EXPECT_EQ(opts.mode, Mode::Decode);
    EXPECT_EQ(opts.input, InputKind::File);
    EXPECT_EQ(opts.input_path, "in.b64");
    EXPECT_EQ(opts.output_path, "out.bin");
    EXPECT_TRUE(opts.ignore_whitespace);
    EXPECT_TRUE(opts.allow_unpadded);
}

TEST(ParseArgsTest, InlineString) {
    const Options opts = parse_args({"decode", "--string", "aGVsbG8="});
    EXPECT_EQ(opts.input, InputKind::Inline);
    EXPECT_EQ(opts.inline_text, "aGVsbG8=");
}

TEST(ParseArgsTest, RejectsInvalidUsage) {
    const std::vector<std::vector<std::string>> cases = {
        {},
        {"transcode"},
        {"encode", "--bogus"},
        {"encode", "--input"},
        {"decode", "-i", "a", "-s", "b"},
        {"decode", "-s", "a", "-s", "b"},
        {"decode", "-o", "a", "-o", "b"},
        {"decode", "-i", ""},
        {"encode", "--ignore-whitespace"},
        {"encode", "-u"},
    };
    for (const auto& args : cases) {
        EXPECT_THROW(parse_args(args), std::runtime_error) << (args.empty() ? "<none>" : args.back());
    }
}

TEST(RunTest, EncodesStandardInput) {
    std::istringstream in("hello");
    std::ostringstream out;
    i2pbase::run(parse_args({"encode"}), in, out);
    EXPECT_EQ(out.str(), "aGVsbG8=");
}

TEST(RunTest, DecodesInlineString) {
    std::istringstream in("ignored");
    std::ostringstream out;
    i2pbase::run(parse_args({"decode", "-s", "-~8="}), in, out);
    EXPECT_EQ(out.str(), std::string("\xFB\xFF"));
}

TEST(RunTest, EncodesInlineString) {
    std::istringstream in;
    std::ostringstream out;
    i2pbase::run(parse_args({"encode", "--string", "foobar"}), in, out);
    EXPECT_EQ(out.str(), "Zm9vYmFy");
}

TEST(RunTest, DecodeOptionsReachTheCodec) {
    std::istringstream strict_in("Zm9v\nYmE\n");
    std::ostringstream strict_out;
    EXPECT_THROW(i2pbase::run(parse_args({"decode"}), strict_in, strict_out), i2pbase::CodecError);

    std::istringstream lenient_in("Zm9v\nYmE\n");
    std::ostringstream lenient_out;
    i2pbase::run(parse_args({"decode", "-w", "-u"}), lenient_in, lenient_out);
    EXPECT_EQ(lenient_out.str(), "fooba");
}

TEST(RunTest, FileInputAndOutput) {
    const std::string input = ::testing::TempDir() + "i2pbase_cli_input.txt";
    const std::string output = ::testing::TempDir() + "i2pbase_cli_output.b64";
    {
        std::ofstream file(input, std::ios::binary);
        file << "foob";
    }
    std::istringstream in;
    std::ostringstream out;
    i2pbase::run(parse_args({"encode", "-i", input, "-o", output}), in, out);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(read_file(output), "Zm9vYg==");

    std::remove(input.c_str());
    std::remove(output.c_str());
}

TEST(RunTest, StandardInputReadFailureIsIOError) {
    for (const char* mode : {"encode", "decode"}) {
        BrokenInputBuf buf("Zm9v");
        std::istream in(&buf);
        std::ostringstream out;
        try {
            i2pbase::run(parse_args({mode}), in, out);
            FAIL() << mode << " reported success on a failed read";
        } catch (const i2pbase::CodecError& err) {
            EXPECT_EQ(err.kind(), i2pbase::ErrorKind::IOError) << mode;
        }
    }
}
