#pragma once

#include <mpaframe/mpaframe.hpp>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace mpaframe {

// Base class for all byte sources
// A source hands out the elementary stream in arbitrary chunk sizes
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Read up to max bytes into dst
    // Blocks until at least one byte is available; returns 0 at end-of-input
    virtual size_t read(uint8_t* dst, size_t max) = 0;

    // Get source description
    virtual const char* description() const = 0;

    // Statistics (common to all sources)
    uint64_t getBytesRead() const { return bytes_read_; }

protected:
    size_t account(size_t n) {
        bytes_read_ += n;
        return n;
    }

private:
    uint64_t bytes_read_{0};
};

// In-memory buffer (borrowed, must outlive the source)
class MemorySource : public ByteSource {
public:
    MemorySource(const uint8_t* data, size_t len);
    explicit MemorySource(const std::vector<uint8_t>& data);
    MemorySource(std::vector<uint8_t>&&) = delete;

    size_t read(uint8_t* dst, size_t max) override;
    const char* description() const override { return "memory"; }

    // Limit each read() to at most this many bytes (0 = no limit)
    void setMaxChunk(size_t max_chunk) { max_chunk_ = max_chunk; }

private:
    const uint8_t* data_;
    size_t len_;
    size_t pos_{0};
    size_t max_chunk_{0};
};

// File on disk, read through std::ifstream
class FileSource : public ByteSource {
public:
    explicit FileSource(const std::string& path);

    bool isOpen() const { return file_.is_open(); }

    size_t read(uint8_t* dst, size_t max) override;
    const char* description() const override { return "file"; }

private:
    std::ifstream file_;
};

// POSIX file descriptor (pipe, socket, device); not owned
class FdSource : public ByteSource {
public:
    explicit FdSource(int fd);

    size_t read(uint8_t* dst, size_t max) override;
    const char* description() const override { return "fd"; }

    // errno of the last failed read (0 if none); a failure ends the input
    int getLastError() const { return last_error_; }

private:
    int fd_;
    int last_error_{0};
};

} // namespace mpaframe
