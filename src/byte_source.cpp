#include <mpaframe/byte_source.hpp>
#include "logging.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace mpaframe {

MemorySource::MemorySource(const uint8_t* data, size_t len)
    : data_(data)
    , len_(len)
{
}

MemorySource::MemorySource(const std::vector<uint8_t>& data)
    : data_(data.data())
    , len_(data.size())
{
}

size_t MemorySource::read(uint8_t* dst, size_t max) {
    size_t n = std::min(max, len_ - pos_);
    if (max_chunk_ > 0) {
        n = std::min(n, max_chunk_);
    }
    if (n > 0) {
        std::memcpy(dst, data_ + pos_, n);
        pos_ += n;
    }
    return account(n);
}

FileSource::FileSource(const std::string& path)
    : file_(path, std::ios::binary)
{
    if (!file_) {
        LOG_ERROR(SOURCE, "Cannot open " << path);
    }
}

size_t FileSource::read(uint8_t* dst, size_t max) {
    if (!file_) {
        return 0;
    }
    file_.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(max));
    return account(static_cast<size_t>(file_.gcount()));
}

FdSource::FdSource(int fd)
    : fd_(fd)
{
}

size_t FdSource::read(uint8_t* dst, size_t max) {
    if (fd_ < 0) {
        return 0;
    }
    while (true) {
        ssize_t n = ::read(fd_, dst, max);
        if (n >= 0) {
            return account(static_cast<size_t>(n));
        }
        if (errno == EINTR) {
            continue;
        }
        last_error_ = errno;
        LOG_WARN(SOURCE, "read() on fd " << fd_ << " failed: " << std::strerror(last_error_));
        return 0;
    }
}

} // namespace mpaframe
