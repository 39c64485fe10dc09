#pragma once
#include <cstdint>
#include <cstddef>
#include <istream>
#include <string>

namespace hid {

// Sequential, closable byte stream consumed by HashId::md5_of_stream.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Reads up to n bytes into buf. Returns 0 at end of stream.
    // Throws HashIdError(IoError) on failure.
    virtual size_t read(uint8_t* buf, size_t n) = 0;

    // Throws HashIdError(IoError) if the underlying close fails.
    virtual void close() = 0;
};

// Adapts a std::istream. close() closes the stream when it is a std::ifstream;
// any other stream is only marked closed.
class IstreamSource : public ByteSource {
public:
    explicit IstreamSource(std::istream& in) : in_(in) {}

    size_t read(uint8_t* buf, size_t n) override;
    void close() override;

    bool closed() const { return closed_; }

private:
    std::istream& in_;
    bool closed_{false};
};

// POSIX file descriptor source.
class FileSource : public ByteSource {
public:
    // Opens path read-only; throws HashIdError(IoError) on failure.
    explicit FileSource(const std::string& path);
    // Adopts an existing descriptor. With owns == false close() leaves fd open.
    FileSource(int fd, bool owns, std::string name = "fd");
    ~FileSource() override;

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    size_t read(uint8_t* buf, size_t n) override;
    void close() override;

    bool is_open() const { return fd_ >= 0; }
    const std::string& name() const { return name_; }

private:
    int         fd_{-1};
    bool        owns_{true};
    std::string name_;
};

// Closes the source on every exit path when enabled. close_now() is the
// normal path and propagates close failures; on unwinding the destructor
// closes and logs a failure instead of throwing.
class SourceCloser {
public:
    SourceCloser(ByteSource& src, bool enabled) : src_(src), armed_(enabled) {}
    ~SourceCloser();

    SourceCloser(const SourceCloser&) = delete;
    SourceCloser& operator=(const SourceCloser&) = delete;

    void close_now();

private:
    ByteSource& src_;
    bool        armed_;
};

}
