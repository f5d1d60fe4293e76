#include "i2pbase/alphabet.hpp"

#include <stdexcept>
#include <string>

#include "i2pbase/errors.hpp"

namespace i2pbase {

Alphabet::Alphabet(const std::string& symbols, char padding) : symbols_(symbols), padding_(padding) {
    if (symbols_.size() != kAlphabetSize) {
        throw std::invalid_argument("Alphabet must contain exactly 64 symbols, got " +
                                    std::to_string(symbols_.size()));
    }
    inverse_.fill(-1);
    for (std::size_t i = 0; i < kAlphabetSize; ++i) {
        const auto slot = static_cast<unsigned char>(symbols_[i]);
        if (inverse_[slot] >= 0) {
            throw std::invalid_argument("Duplicate alphabet symbol " + describe_char(symbols_[i]));
        }
        inverse_[slot] = static_cast<std::int8_t>(i);
    }
    if (inverse_[static_cast<unsigned char>(padding_)] >= 0) {
        throw std::invalid_argument("Padding symbol " + describe_char(padding_) + " is part of the alphabet");
    }
}

const Alphabet& Alphabet::i2p() {
    static const Alphabet alphabet(kI2pSymbols, kPaddingSymbol);
    return alphabet;
}

const Alphabet& Alphabet::standard() {
    static const Alphabet alphabet(kStandardSymbols, kPaddingSymbol);
    return alphabet;
}

char Alphabet::symbol_of(std::size_t index) const {
    if (index >= kAlphabetSize) {
        throw std::out_of_range("Alphabet index out of range: " + std::to_string(index));
    }
    return symbols_[index];
}

std::size_t Alphabet::index_of(char c) const {
    const int index = lookup(c);
    if (index < 0) {
        throw CodecError(ErrorKind::InvalidSymbol, "character " + describe_char(c) + " is not in the alphabet");
    }
    return static_cast<std::size_t>(index);
}

}  // namespace i2pbase
