#pragma once

#include <mpaframe/mpaframe.hpp>
#include <mpaframe/byte_source.hpp>
#include <memory>
#include <string>

namespace mpaframe {

// Scanner state machine
enum class ScanState {
    Seeking,        // looking for a sync word
    Validating,     // candidate found, waiting for header/frame bytes
    Resyncing,      // candidate rejected, skip one byte
    Done            // input exhausted
};

const char* toString(ScanState state);

/**
 * MPEG audio elementary stream scanner.
 *
 * Splits a byte stream into frames. Candidates start at a sync word; a
 * candidate becomes a frame once its header decodes and all of its bytes
 * (length computed from the header) are available. A rejected candidate
 * costs one byte and the search continues from the next byte, so garbage,
 * tags and damaged frames are skipped rather than failing the scan.
 *
 * Data can arrive in chunks of any size. When a candidate needs more bytes
 * than have been fed, feed() returns and the scan continues on the next
 * feed() without re-reading buffered data.
 *
 * Usage:
 *   FrameScanner scanner;
 *   while (have_data) {
 *       scanner.feed(data, len);
 *   }
 *   ParsedStream stream = scanner.finish();
 */
class FrameScanner {
public:
    FrameScanner();
    ~FrameScanner();

    // Non-copyable
    FrameScanner(const FrameScanner&) = delete;
    FrameScanner& operator=(const FrameScanner&) = delete;

    /**
     * Set callback for confirmed frames.
     * The data pointer is only valid during the call.
     */
    void setFrameCallback(FrameCallback callback);

    /**
     * Set callback for rejected candidates (resync causes).
     */
    void setErrorCallback(FrameErrorCallback callback);

    /**
     * Keep a copy of each frame in the ParsedStream (default: true).
     * With false only counters are kept; frames reach the caller through
     * the frame callback.
     */
    void setRetainFrames(bool retain);

    /**
     * Only accept a frame when a sync word (or end of input) follows it
     * (default: false).
     *
     * Off: a valid-looking header inside garbage is taken as a frame, and
     * its length may run over the real frame that follows.
     * On: such a header is rejected, but so is a real frame directly
     * followed by garbage.
     */
    void setVerifyNextSync(bool verify);

    /**
     * Feed stream data.
     * Can be called with any amount of data (handles partial frames).
     *
     * @param data  Stream bytes
     * @param len   Length of data in bytes
     * @return      Number of frames confirmed by this call
     */
    size_t feed(const uint8_t* data, size_t len);

    /**
     * Signal end of input, drain the buffer and return the result.
     * The scanner is Done afterwards; reset() makes it reusable.
     */
    ParsedStream finish();

    // Reset scanner state
    void reset();

    ScanState state() const;
    bool isDone() const;

    // Statistics
    size_t getFrameCount() const;
    uint64_t getSkippedBytes() const;
    uint64_t getConsumedBytes() const;
    size_t getSyncErrors() const;       // times lock was lost after a confirmed frame
    size_t getBufferedBytes() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * Scan a whole byte source.
 *
 * @param source      Source to read until end-of-input
 * @param chunk_size  Bytes requested per read
 * @return            Parsed stream
 */
ParsedStream parseStream(ByteSource& source, size_t chunk_size = 65536);

/**
 * Scan an MPEG audio file.
 *
 * Convenience function; a file that cannot be opened yields an empty stream.
 *
 * @param file_path   Path to elementary stream file (.mp1/.mp2/.mp3)
 * @return            Parsed stream
 */
ParsedStream parseFile(const std::string& file_path);

} // namespace mpaframe
