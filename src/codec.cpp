#include "i2pbase/codec.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include "i2pbase/errors.hpp"

namespace i2pbase {

namespace {

// Staged output is handed to the sink once it reaches this size.
constexpr std::size_t kOutputChunkSize = 4 * 1024;

bool is_ignorable(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

}  // namespace

std::size_t encoded_length(std::size_t input_bytes) {
    return (input_bytes + 2) / 3 * 4;
}

Encoder::Encoder(Sink& sink, const Alphabet& alphabet) : sink_(sink), alphabet_(alphabet) {
    output_.reserve(kOutputChunkSize + 4);
}

void Encoder::update(const std::uint8_t* data, std::size_t size) {
    if (finished_) {
        throw std::logic_error("Encoder used after finish");
    }
    std::size_t i = 0;
    if (pending_size_ > 0) {
        while (pending_size_ < 3 && i < size) {
            pending_[pending_size_++] = data[i++];
        }
        if (pending_size_ < 3) {
            return;
        }
        encode_group(pending_);
        pending_size_ = 0;
    }
    for (; i + 3 <= size; i += 3) {
        encode_group(data + i);
    }
    while (i < size) {
        pending_[pending_size_++] = data[i++];
    }
    flush_output();
}

void Encoder::finish() {
    if (finished_) {
        throw std::logic_error("Encoder finished twice");
    }
    finished_ = true;
    if (pending_size_ > 0) {
        std::uint32_t value = static_cast<std::uint32_t>(pending_[0]) << 16;
        if (pending_size_ == 2) {
            value |= static_cast<std::uint32_t>(pending_[1]) << 8;
        }
        output_.push_back(alphabet_.symbol_of((value >> 18) & 0x3F));
        output_.push_back(alphabet_.symbol_of((value >> 12) & 0x3F));
        if (pending_size_ == 2) {
            output_.push_back(alphabet_.symbol_of((value >> 6) & 0x3F));
        } else {
            output_.push_back(alphabet_.padding());
        }
        output_.push_back(alphabet_.padding());
        pending_size_ = 0;
    }
    flush_output();
}

void Encoder::encode_group(const std::uint8_t* group) {
    const std::uint32_t value = (static_cast<std::uint32_t>(group[0]) << 16) |
                                (static_cast<std::uint32_t>(group[1]) << 8) |
                                static_cast<std::uint32_t>(group[2]);
    output_.push_back(alphabet_.symbol_of((value >> 18) & 0x3F));
    output_.push_back(alphabet_.symbol_of((value >> 12) & 0x3F));
    output_.push_back(alphabet_.symbol_of((value >> 6) & 0x3F));
    output_.push_back(alphabet_.symbol_of(value & 0x3F));
    if (output_.size() >= kOutputChunkSize) {
        flush_output();
    }
}

void Encoder::flush_output() {
    if (output_.empty()) {
        return;
    }
    sink_.write_chunk(reinterpret_cast<const std::uint8_t*>(output_.data()), output_.size());
    output_.clear();
}

Decoder::Decoder(Sink& sink, const DecodeOptions& options, const Alphabet& alphabet)
    : sink_(sink), options_(options), alphabet_(alphabet) {
    output_.reserve(kOutputChunkSize + 3);
}

void Decoder::update(const char* data, std::size_t size) {
    if (finished_) {
        throw std::logic_error("Decoder used after finish");
    }
    for (std::size_t i = 0; i < size; ++i) {
        const char c = data[i];
        const std::size_t offset = consumed_++;
        if (options_.ignore_whitespace && is_ignorable(c)) {
            continue;
        }
        const bool is_padding = c == alphabet_.padding();
        const int index = is_padding ? 0 : alphabet_.lookup(c);
        if (index < 0) {
            throw CodecError(ErrorKind::InvalidSymbol, "unexpected character " + describe_char(c), offset);
        }
        if (padded_group_seen_) {
            throw CodecError(ErrorKind::InvalidPadding, "data after the final padded group", offset);
        }
        if (is_padding) {
            if (group_size_ < 2) {
                throw CodecError(ErrorKind::InvalidPadding,
                                 "padding in position " + std::to_string(group_size_) + " of a group", offset);
            }
            ++group_padding_;
        } else if (group_padding_ > 0) {
            throw CodecError(ErrorKind::InvalidPadding, "symbol " + describe_char(c) + " after padding", offset);
        }
        group_[group_size_++] = static_cast<std::uint8_t>(index);
        ++symbols_read_;
        if (group_size_ == 4) {
            decode_group();
        }
    }
    flush_output();
}

void Decoder::finish() {
    if (finished_) {
        throw std::logic_error("Decoder finished twice");
    }
    finished_ = true;
    if (group_size_ > 0) {
        if (!options_.allow_unpadded) {
            throw CodecError(ErrorKind::InvalidLength,
                             "encoded length " + std::to_string(symbols_read_) + " is not a multiple of 4", consumed_);
        }
        if (group_padding_ > 0) {
            throw CodecError(ErrorKind::InvalidPadding, "incomplete padded group", consumed_);
        }
        if (group_size_ == 1) {
            throw CodecError(ErrorKind::InvalidLength, "final group holds a single symbol", consumed_);
        }
        group_padding_ = 4 - group_size_;
        while (group_size_ < 4) {
            group_[group_size_++] = 0;
        }
        decode_group();
    }
    flush_output();
}

void Decoder::decode_group() {
    const std::uint32_t value = (static_cast<std::uint32_t>(group_[0]) << 18) |
                                (static_cast<std::uint32_t>(group_[1]) << 12) |
                                (static_cast<std::uint32_t>(group_[2]) << 6) |
                                static_cast<std::uint32_t>(group_[3]);
    output_.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    if (group_padding_ < 2) {
        output_.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    }
    if (group_padding_ < 1) {
        output_.push_back(static_cast<std::uint8_t>(value & 0xFF));
    }
    padded_group_seen_ = group_padding_ > 0;
    group_size_ = 0;
    group_padding_ = 0;
    if (output_.size() >= kOutputChunkSize) {
        flush_output();
    }
}

void Decoder::flush_output() {
    if (output_.empty()) {
        return;
    }
    sink_.write_chunk(output_.data(), output_.size());
    output_.clear();
}

void encode(Source& source, Sink& sink, const Alphabet& alphabet) {
    Encoder encoder(sink, alphabet);
    std::vector<std::uint8_t> buffer(kEncodeChunkSize);
    while (true) {
        const std::size_t got = source.read_chunk(buffer.data(), buffer.size());
        if (got == 0) {
            break;
        }
        encoder.update(buffer.data(), got);
    }
    encoder.finish();
    sink.flush();
}

void decode(Source& source, Sink& sink, const DecodeOptions& options, const Alphabet& alphabet) {
    Decoder decoder(sink, options, alphabet);
    std::vector<std::uint8_t> buffer(kDecodeChunkSize);
    while (true) {
        const std::size_t got = source.read_chunk(buffer.data(), buffer.size());
        if (got == 0) {
            break;
        }
        decoder.update(reinterpret_cast<const char*>(buffer.data()), got);
    }
    decoder.finish();
    sink.flush();
}

std::string encode_bytes(const std::uint8_t* data, std::size_t size, const Alphabet& alphabet) {
    std::string text;
    text.reserve(encoded_length(size));
    StringSink sink(text);
    Encoder encoder(sink, alphabet);
    encoder.update(data, size);
    encoder.finish();
    return text;
}

std::string encode_bytes(const std::vector<std::uint8_t>& bytes, const Alphabet& alphabet) {
    return encode_bytes(bytes.data(), bytes.size(), alphabet);
}

std::vector<std::uint8_t> decode_string(const std::string& text, const DecodeOptions& options,
                                        const Alphabet& alphabet) {
    std::vector<std::uint8_t> bytes;
    bytes.reserve(text.size() / 4 * 3);
    BufferSink sink(bytes);
    Decoder decoder(sink, options, alphabet);
    decoder.update(text.data(), text.size());
    decoder.finish();
    return bytes;
}

void encode_file(const std::string& input_path, const std::string& output_path, const Alphabet& alphabet) {
    FileSource source(input_path);
    FileSink sink(output_path);
    encode(source, sink, alphabet);
}

void decode_file(const std::string& input_path,
                 const std::string& output_path,
                 const DecodeOptions& options,
                 const Alphabet& alphabet) {
    FileSource source(input_path);
    FileSink sink(output_path);
    decode(source, sink, options, alphabet);
}

}  // namespace i2pbase
