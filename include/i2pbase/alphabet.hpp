#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace i2pbase {

constexpr std::size_t kAlphabetSize = 64;
constexpr char kPaddingSymbol = '=';

// A-Z, a-z, 0-9, then '-' in place of '+' and '~' in place of '/'.
constexpr char kI2pSymbols[kAlphabetSize + 1] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-~";

// RFC 4648 section 4.
constexpr char kStandardSymbols[kAlphabetSize + 1] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// 64 distinct symbols plus a padding symbol outside the set. Immutable once built.
class Alphabet {
public:
    // Throws std::invalid_argument unless symbols holds exactly 64 distinct
    // characters and padding is not one of them.
    Alphabet(const std::string& symbols, char padding);

    // Shared instances, built on first use.
    static const Alphabet& i2p();
    static const Alphabet& standard();

    // Throws std::out_of_range for index >= 64.
    char symbol_of(std::size_t index) const;

    // Throws CodecError(InvalidSymbol) for anything outside the 64 symbols,
    // the padding symbol included.
    std::size_t index_of(char c) const;

    // Returns -1 when c is not one of the 64 symbols.
    int lookup(char c) const {
        return inverse_[static_cast<unsigned char>(c)];
    }

    bool contains(char c) const { return lookup(c) >= 0; }
    char padding() const { return padding_; }
    const std::string& symbols() const { return symbols_; }

private:
    std::string symbols_;
    char padding_;
    std::array<std::int8_t, 256> inverse_;
};

}  // namespace i2pbase
