#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "i2pbase/alphabet.hpp"
#include "i2pbase/stream.hpp"

namespace i2pbase {

// Read sizes used by the streaming operations; both stay group aligned.
constexpr std::size_t kEncodeChunkSize = 3 * 1024;
constexpr std::size_t kDecodeChunkSize = 4 * 1024;

struct DecodeOptions {
    bool ignore_whitespace{false};  // skip space, \t, \r, \n, \v, \f
    bool allow_unpadded{false};     // accept a final group of 2 or 3 symbols
};

// 4 * ceil(n / 3).
std::size_t encoded_length(std::size_t input_bytes);

// Incremental encoder. Holds back at most two bytes between updates.
class Encoder {
public:
    explicit Encoder(Sink& sink, const Alphabet& alphabet = Alphabet::i2p());

    void update(const std::uint8_t* data, std::size_t size);

    // Emits the padded final group. The encoder cannot be used afterwards.
    void finish();

private:
    void encode_group(const std::uint8_t* group);
    void flush_output();

    Sink& sink_;
    const Alphabet& alphabet_;
    std::uint8_t pending_[3];
    std::size_t pending_size_{0};
    std::string output_;
    bool finished_{false};
};

// Incremental decoder. Offsets in errors count every character seen so far,
// ignored whitespace included.
class Decoder {
public:
    explicit Decoder(Sink& sink, const DecodeOptions& options = DecodeOptions{},
                     const Alphabet& alphabet = Alphabet::i2p());

    void update(const char* data, std::size_t size);

    // Validates the trailing group. The decoder cannot be used afterwards.
    void finish();

    std::size_t characters_read() const { return consumed_; }

private:
    void decode_group();
    void flush_output();

    Sink& sink_;
    DecodeOptions options_;
    const Alphabet& alphabet_;
    std::uint8_t group_[4];
    std::size_t group_size_{0};
    std::size_t group_padding_{0};
    std::size_t consumed_{0};
    std::size_t symbols_read_{0};
    bool padded_group_seen_{false};
    std::vector<std::uint8_t> output_;
    bool finished_{false};
};

// Encodes the whole source into sink and flushes it.
void encode(Source& source, Sink& sink, const Alphabet& alphabet = Alphabet::i2p());

// Decodes the whole source into sink and flushes it. Output written before a
// failure stays in the sink.
void decode(Source& source, Sink& sink, const DecodeOptions& options = DecodeOptions{},
            const Alphabet& alphabet = Alphabet::i2p());

std::string encode_bytes(const std::uint8_t* data, std::size_t size, const Alphabet& alphabet = Alphabet::i2p());
std::string encode_bytes(const std::vector<std::uint8_t>& bytes, const Alphabet& alphabet = Alphabet::i2p());

std::vector<std::uint8_t> decode_string(const std::string& text, const DecodeOptions& options = DecodeOptions{},
                                        const Alphabet& alphabet = Alphabet::i2p());

void encode_file(const std::string& input_path,
                 const std::string& output_path,
                 const Alphabet& alphabet = Alphabet::i2p());

void decode_file(const std::string& input_path,
                 const std::string& output_path,
                 const DecodeOptions& options = DecodeOptions{},
                 const Alphabet& alphabet = Alphabet::i2p());

}  // namespace i2pbase
