// Frame Scanner - splits MPEG audio elementary streams into frames

#include <mpaframe/frame_scanner.hpp>
#include "stream_builder.hpp"
#include "logging.h"
#include <vector>

namespace mpaframe {

const char* toString(ScanState state) {
    switch (state) {
        case ScanState::Seeking:    return "seeking";
        case ScanState::Validating: return "validating";
        case ScanState::Resyncing:  return "resyncing";
        case ScanState::Done:       return "done";
    }
    return "?";
}

struct FrameScanner::Impl {
    // Unconsumed input; buffer[pos] is the cursor
    std::vector<uint8_t> buffer;
    size_t pos{0};
    uint64_t base_offset{0};        // Stream offset of buffer[0]

    ScanState state{ScanState::Seeking};
    bool eof{false};
    bool locked{false};             // Last candidate became a frame

    // Candidate under validation (header already decoded)
    std::optional<FrameHeader> candidate;
    uint32_t candidate_len{0};

    ParsedStream stream;

    // Configuration
    FrameCallback frame_callback;
    FrameErrorCallback error_callback;
    bool retain_frames{true};
    bool verify_next_sync{false};

    // Statistics (survive finish())
    size_t frame_count{0};
    uint64_t framed_bytes{0};
    uint64_t skipped_bytes{0};
    size_t sync_errors{0};

    Impl() {
        buffer.reserve(8192);
    }

    size_t available() const { return buffer.size() - pos; }

    void skip(size_t n) {
        if (n == 0) return;
        if (locked) {
            sync_errors++;
            locked = false;
            LOG_DEBUG(SCANNER, "Sync lost at offset " << base_offset + pos);
        }
        pos += n;
        skipped_bytes += n;
        StreamBuilder::addSkipped(stream, n);
    }

    void reject(FrameError error) {
        uint64_t offset = base_offset + pos;
        LOG_DEBUG(SCANNER, "Candidate at offset " << offset << " rejected: " << errorString(error));
        StreamBuilder::addError(stream, error);
        if (error_callback) {
            error_callback(error, offset);
        }
        candidate.reset();
        candidate_len = 0;
        state = ScanState::Resyncing;
    }

    void emit() {
        const uint8_t* data = buffer.data() + pos;
        uint64_t offset = base_offset + pos;

        if (frame_count == 0) {
            LOG_DEBUG(SCANNER, "Sync acquired at offset " << offset << ": " << describe(*candidate));
        }

        if (frame_callback) {
            frame_callback(*candidate, offset, data, candidate_len);
        }
        StreamBuilder::addFrame(stream, *candidate, offset, data, candidate_len, retain_frames);

        frame_count++;
        framed_bytes += candidate_len;
        pos += candidate_len;
        locked = true;
        candidate.reset();
        candidate_len = 0;
        state = ScanState::Seeking;
    }

    // Search forward for a sync word
    // Returns false when more input is needed
    bool seek() {
        size_t p = pos;
        while (p + 1 < buffer.size() && !isSync(buffer.data() + p)) {
            p++;
        }

        if (p + 1 < buffer.size()) {
            skip(p - pos);
            state = ScanState::Validating;
            return true;
        }

        if (eof) {
            skip(available());
            state = ScanState::Done;
            return true;
        }

        // A trailing 0xFF may be the first half of a sync word
        size_t keep = (available() > 0 && buffer.back() == 0xFF) ? 1 : 0;
        skip(available() - keep);
        return false;
    }

    // Decode the candidate and wait for all of its bytes
    // Returns false when more input is needed
    bool validate() {
        if (!candidate) {
            if (available() < HEADER_SIZE) {
                if (eof) {
                    reject(FrameError::TruncatedPayload);
                    return true;
                }
                return false;
            }

            HeaderResult result = decodeHeader(buffer.data() + pos);
            if (!result) {
                reject(result.error);
                return true;
            }

            // Free format: no trustworthy length, look for the next sync instead
            FrameError length_error = FrameError::None;
            auto length = frameLengthBytes(*result.header, &length_error);
            if (!length) {
                reject(length_error);
                return true;
            }

            candidate = result.header;
            candidate_len = *length;
        }

        if (available() < candidate_len) {
            if (eof) {
                reject(FrameError::TruncatedPayload);
                return true;
            }
            return false;
        }

        if (verify_next_sync) {
            size_t next = pos + candidate_len;
            size_t after = buffer.size() - next;
            if (after < 2) {
                if (!eof) {
                    return false;
                }
            } else if (!isSync(buffer.data() + next)) {
                reject(FrameError::SyncWordMissing);
                return true;
            }
        }

        emit();
        return true;
    }

    // Run the state machine until it needs more input or is done
    size_t run() {
        size_t before = frame_count;
        bool progress = true;

        while (progress) {
            switch (state) {
                case ScanState::Seeking:
                    progress = seek();
                    break;
                case ScanState::Validating:
                    progress = validate();
                    break;
                case ScanState::Resyncing:
                    // Retry one byte after the rejected candidate
                    skip(1);
                    state = ScanState::Seeking;
                    break;
                case ScanState::Done:
                    progress = false;
                    break;
            }
        }

        return frame_count - before;
    }

    // Drop consumed bytes from the buffer
    void compact() {
        if (pos == 0) return;
        buffer.erase(buffer.begin(), buffer.begin() + pos);
        base_offset += pos;
        pos = 0;
    }
};

FrameScanner::FrameScanner()
    : impl_(std::make_unique<Impl>())
{
}

FrameScanner::~FrameScanner() = default;

void FrameScanner::setFrameCallback(FrameCallback callback) {
    impl_->frame_callback = std::move(callback);
}

void FrameScanner::setErrorCallback(FrameErrorCallback callback) {
    impl_->error_callback = std::move(callback);
}

void FrameScanner::setRetainFrames(bool retain) {
    impl_->retain_frames = retain;
}

void FrameScanner::setVerifyNextSync(bool verify) {
    impl_->verify_next_sync = verify;
}

size_t FrameScanner::feed(const uint8_t* data, size_t len) {
    if (impl_->state == ScanState::Done) {
        LOG_WARN(SCANNER, "feed() after finish(), " << len << " bytes ignored");
        return 0;
    }
    if (!data || len == 0) {
        return 0;
    }

    impl_->buffer.insert(impl_->buffer.end(), data, data + len);
    size_t frames = impl_->run();
    impl_->compact();
    return frames;
}

ParsedStream FrameScanner::finish() {
    if (impl_->state == ScanState::Done) {
        return std::move(impl_->stream);
    }

    impl_->eof = true;
    impl_->run();
    impl_->compact();

    LOG_DEBUG(SCANNER, "Scan done: " << impl_->frame_count << " frames, "
              << impl_->framed_bytes << " framed bytes, "
              << impl_->skipped_bytes << " skipped bytes");

    ParsedStream result = std::move(impl_->stream);
    impl_->stream = ParsedStream();
    return result;
}

void FrameScanner::reset() {
    FrameCallback frame_callback = std::move(impl_->frame_callback);
    FrameErrorCallback error_callback = std::move(impl_->error_callback);
    bool retain = impl_->retain_frames;
    bool verify = impl_->verify_next_sync;

    impl_ = std::make_unique<Impl>();
    impl_->frame_callback = std::move(frame_callback);
    impl_->error_callback = std::move(error_callback);
    impl_->retain_frames = retain;
    impl_->verify_next_sync = verify;
}

ScanState FrameScanner::state() const {
    return impl_->state;
}

bool FrameScanner::isDone() const {
    return impl_->state == ScanState::Done;
}

size_t FrameScanner::getFrameCount() const {
    return impl_->frame_count;
}

uint64_t FrameScanner::getSkippedBytes() const {
    return impl_->skipped_bytes;
}

uint64_t FrameScanner::getConsumedBytes() const {
    return impl_->framed_bytes + impl_->skipped_bytes;
}

size_t FrameScanner::getSyncErrors() const {
    return impl_->sync_errors;
}

size_t FrameScanner::getBufferedBytes() const {
    return impl_->buffer.size() - impl_->pos;
}

ParsedStream parseStream(ByteSource& source, size_t chunk_size) {
    FrameScanner scanner;
    std::vector<uint8_t> chunk(chunk_size > 0 ? chunk_size : 65536);

    size_t n;
    while ((n = source.read(chunk.data(), chunk.size())) > 0) {
        scanner.feed(chunk.data(), n);
    }

    return scanner.finish();
}

ParsedStream parseFile(const std::string& file_path) {
    FileSource source(file_path);
    if (!source.isOpen()) {
        return ParsedStream();  // Empty result on file open failure
    }
    return parseStream(source);
}

} // namespace mpaframe
