#include "i2pbase/errors.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using i2pbase::CodecError;
using i2pbase::ErrorKind;

TEST(ErrorsTest, KindNames) {
    EXPECT_STREQ(i2pbase::error_kind_name(ErrorKind::InvalidSymbol), "InvalidSymbol");
    EXPECT_STREQ(i2pbase::error_kind_name(ErrorKind::InvalidLength), "InvalidLength");
    EXPECT_STREQ(i2pbase::error_kind_name(ErrorKind::InvalidPadding), "InvalidPadding");
    EXPECT_STREQ(i2pbase::error_kind_name(ErrorKind::IOError), "IOError");
}

TEST(ErrorsTest, MessageCarriesKindAndOffset) {
    const CodecError err(ErrorKind::InvalidPadding, "symbol 'Q' after padding", 7);
    EXPECT_EQ(err.kind(), ErrorKind::InvalidPadding);
    EXPECT_TRUE(err.has_offset());
    EXPECT_EQ(err.offset(), 7u);
    EXPECT_STREQ(err.what(), "InvalidPadding: symbol 'Q' after padding at offset 7");
}

TEST(ErrorsTest, OffsetIsOptional) {
    const CodecError err(ErrorKind::IOError, "failed to read input stream");
    EXPECT_FALSE(err.has_offset());
    EXPECT_STREQ(err.what(), "IOError: failed to read input stream");

    const std::runtime_error& base = err;
    EXPECT_EQ(std::string(base.what()), err.what());
}

TEST(ErrorsTest, DescribeChar) {
    EXPECT_EQ(i2pbase::describe_char('+'), "'+'");
    EXPECT_EQ(i2pbase::describe_char(' '), "0x20");
    EXPECT_EQ(i2pbase::describe_char('\n'), "0x0A");
    EXPECT_EQ(i2pbase::describe_char(static_cast<char>(0xC3)), "0xC3");
}
