#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace i2pbase {

// Readable end of a transform. Read failures throw CodecError(IOError).
class Source {
public:
    virtual ~Source() = default;

    // Reads up to size bytes into buffer. Returns 0 once the source is exhausted.
    virtual std::size_t read_chunk(std::uint8_t* buffer, std::size_t size) = 0;
};

// Writable end of a transform. Write failures throw CodecError(IOError).
class Sink {
public:
    virtual ~Sink() = default;

    virtual void write_chunk(const std::uint8_t* data, std::size_t size) = 0;
    virtual void flush() {}
};

class StreamSource : public Source {
public:
    explicit StreamSource(std::istream& in) : in_(in) {}

    std::size_t read_chunk(std::uint8_t* buffer, std::size_t size) override;

private:
    std::istream& in_;
};

class StreamSink : public Sink {
public:
    explicit StreamSink(std::ostream& out) : out_(out) {}

    void write_chunk(const std::uint8_t* data, std::size_t size) override;
    void flush() override;

private:
    std::ostream& out_;
};

// Opens path in binary mode; throws CodecError(IOError) if it cannot.
class FileSource : public Source {
public:
    explicit FileSource(const std::string& path);

    std::size_t read_chunk(std::uint8_t* buffer, std::size_t size) override;

private:
    std::ifstream file_;
    StreamSource stream_;
};

// Creates or truncates path; throws CodecError(IOError) if it cannot.
class FileSink : public Sink {
public:
    explicit FileSink(const std::string& path);

    void write_chunk(const std::uint8_t* data, std::size_t size) override;
    void flush() override;

private:
    std::ofstream file_;
    StreamSink stream_;
};

// Reads from memory owned by the caller, which must outlive the source.
class MemorySource : public Source {
public:
    MemorySource(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}
    explicit MemorySource(const std::vector<std::uint8_t>& bytes) : MemorySource(bytes.data(), bytes.size()) {}
    explicit MemorySource(const std::string& text)
        : MemorySource(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()) {}
    MemorySource(std::vector<std::uint8_t>&&) = delete;
    MemorySource(std::string&&) = delete;

    std::size_t read_chunk(std::uint8_t* buffer, std::size_t size) override;

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t position_{0};
};

// Appends to a caller-owned string.
class StringSink : public Sink {
public:
    explicit StringSink(std::string& text) : text_(text) {}

    void write_chunk(const std::uint8_t* data, std::size_t size) override;

private:
    std::string& text_;
};

// Appends to a caller-owned byte vector.
class BufferSink : public Sink {
public:
    explicit BufferSink(std::vector<std::uint8_t>& bytes) : bytes_(bytes) {}

    void write_chunk(const std::uint8_t* data, std::size_t size) override;

private:
    std::vector<std::uint8_t>& bytes_;
};

}  // namespace i2pbase
