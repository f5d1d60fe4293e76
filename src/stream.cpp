#include "i2pbase/stream.hpp"

#include <algorithm>
#include <cstring>

#include "i2pbase/errors.hpp"

namespace i2pbase {

std::size_t StreamSource::read_chunk(std::uint8_t* buffer, std::size_t size) {
    if (in_.bad()) {
        throw CodecError(ErrorKind::IOError, "input stream is unreadable");
    }
    if (!in_ || size == 0) {
        return 0;
    }
    in_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(size));
    if (in_.bad()) {
        throw CodecError(ErrorKind::IOError, "failed to read input stream");
    }
    return static_cast<std::size_t>(in_.gcount());
}

void StreamSink::write_chunk(const std::uint8_t* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!out_) {
        throw CodecError(ErrorKind::IOError, "failed to write output stream");
    }
}

void StreamSink::flush() {
    out_.flush();
    if (!out_) {
        throw CodecError(ErrorKind::IOError, "failed to flush output stream");
    }
}

FileSource::FileSource(const std::string& path) : file_(path, std::ios::binary), stream_(file_) {
    if (!file_) {
        throw CodecError(ErrorKind::IOError, "cannot open input file: " + path);
    }
}

std::size_t FileSource::read_chunk(std::uint8_t* buffer, std::size_t size) {
    return stream_.read_chunk(buffer, size);
}

FileSink::FileSink(const std::string& path) : file_(path, std::ios::binary | std::ios::trunc), stream_(file_) {
    if (!file_) {
        throw CodecError(ErrorKind::IOError, "cannot open output file: " + path);
    }
}

void FileSink::write_chunk(const std::uint8_t* data, std::size_t size) {
    stream_.write_chunk(data, size);
}

void FileSink::flush() {
    stream_.flush();
}

std::size_t MemorySource::read_chunk(std::uint8_t* buffer, std::size_t size) {
    const std::size_t count = std::min(size, size_ - position_);
    if (count > 0) {
        std::memcpy(buffer, data_ + position_, count);
        position_ += count;
    }
    return count;
}

void StringSink::write_chunk(const std::uint8_t* data, std::size_t size) {
    text_.append(reinterpret_cast<const char*>(data), size);
}

void BufferSink::write_chunk(const std::uint8_t* data, std::size_t size) {
    bytes_.insert(bytes_.end(), data, data + size);
}

}  // namespace i2pbase
