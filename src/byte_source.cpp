#include "byte_source.h"
#include "errors.h"
#include "log.h"

#include <fstream>
#include <cerrno>
#include <cstring>
#include <utility>

#ifndef _WIN32
#include <unistd.h>
#include <fcntl.h>
#endif

namespace hid {

// ---- IstreamSource ----

size_t IstreamSource::read(uint8_t* buf, size_t n) {
    if (closed_) throw HashIdError(ErrorKind::IoError, "read on closed stream");
    if (n == 0 || in_.eof()) return 0;
    if (in_.fail()) throw HashIdError(ErrorKind::IoError, "stream is in a failed state");
    in_.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(n));
    if (in_.bad()) throw HashIdError(ErrorKind::IoError, "stream read failed");
    return static_cast<size_t>(in_.gcount());
}

void IstreamSource::close() {
    if (closed_) return;
    closed_ = true;
    if (auto* f = dynamic_cast<std::ifstream*>(&in_)) {
        f->clear();  // eof/fail from draining the stream are not close errors
        f->close();
        if (f->fail()) throw HashIdError(ErrorKind::IoError, "ifstream close failed");
    }
}

// ---- FileSource ----

FileSource::FileSource(const std::string& path) : owns_(true), name_(path) {
#ifdef O_CLOEXEC
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
#else
    fd_ = ::open(path.c_str(), O_RDONLY);
#endif
    if (fd_ < 0) {
        throw HashIdError(ErrorKind::IoError,
                          "open " + path + ": " + std::strerror(errno));
    }
}

FileSource::FileSource(int fd, bool owns, std::string name)
    : fd_(fd), owns_(owns), name_(std::move(name)) {}

FileSource::~FileSource() {
    if (fd_ >= 0 && owns_) {
        if (::close(fd_) != 0) {
            log_warn(LogCategory::IO, "close " + name_ + ": " + std::strerror(errno));
        }
    }
}

size_t FileSource::read(uint8_t* buf, size_t n) {
    if (fd_ < 0) throw HashIdError(ErrorKind::IoError, "read on closed " + name_);
    ssize_t r = ::read(fd_, buf, n);
    if (r < 0) {
        // EINTR included: interruption is reported, not retried
        throw HashIdError(ErrorKind::IoError,
                          "read " + name_ + ": " + std::strerror(errno));
    }
    return static_cast<size_t>(r);
}

void FileSource::close() {
    if (fd_ < 0) return;
    int fd = fd_;
    fd_ = -1;
    if (owns_ && ::close(fd) != 0) {
        throw HashIdError(ErrorKind::IoError,
                          "close " + name_ + ": " + std::strerror(errno));
    }
}

// ---- SourceCloser ----

void SourceCloser::close_now() {
    if (!armed_) return;
    armed_ = false;
    src_.close();
}

SourceCloser::~SourceCloser() {
    if (!armed_) return;
    armed_ = false;
    try {
        src_.close();
    } catch (const std::exception& e) {
        // Already unwinding from the read failure
        log_error(LogCategory::IO, std::string("close during unwind: ") + e.what());
    }
}

}
