#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <functional>
#include <optional>
#include <variant>

namespace mpaframe {

// MPEG audio version (2-bit field, 01 is reserved)
enum class Version {
    Mpeg1,
    Mpeg2,
    Mpeg25
};

// Codec layer (2-bit field, 00 is reserved)
enum class Layer {
    I,
    II,
    III
};

enum class ChannelMode {
    Stereo,
    JointStereo,
    DualChannel,
    SingleChannel   // Mono
};

// De-emphasis to apply after decoding (10 is reserved)
enum class Emphasis {
    None,
    Ms5015,         // 50/15 us
    CcitJ17
};

// Byte order of the 4-byte header window handed to decodeHeader()
enum class ByteOrder {
    BigEndian,      // wire order
    LittleEndian
};

// Reasons a candidate frame is rejected. None of these abort a scan,
// the scanner resynchronizes on the next byte instead.
enum class FrameError {
    None = 0,
    SyncWordMissing,
    ReservedVersion,
    ReservedLayer,
    InvalidBitrateIndex,
    ReservedSampleRate,
    ReservedEmphasis,
    ProhibitedBitrateChannelCombination,
    UndefinedFrameLength,   // free format, length not derivable from header
    TruncatedPayload        // input ended before the declared frame length
};

constexpr size_t FRAME_ERROR_KIND_COUNT = 10;

// MPEG audio header constants
constexpr size_t HEADER_SIZE = 4;
constexpr size_t CRC_SIZE = 2;
constexpr uint32_t SYNC_MASK = 0xFFE00000;   // 0xFFE over the top three nibbles

const char* errorString(FrameError error);

// Joint stereo mode extension (only present when channel mode is JointStereo)
struct BandStart {
    uint8_t band{4};            // First subband coded in intensity stereo: 4, 8, 12 or 16
    bool operator==(const BandStart& other) const { return band == other.band; }
};

struct StereoFlags {
    bool intensity_stereo{false};
    bool ms_stereo{false};
    bool operator==(const StereoFlags& other) const {
        return intensity_stereo == other.intensity_stereo && ms_stereo == other.ms_stereo;
    }
};

// Layer I/II carry BandStart, Layer III carries StereoFlags
using ModeExtension = std::variant<std::monostate, BandStart, StereoFlags>;

/**
 * Decoded MPEG audio frame header.
 *
 * Instances are only created by decodeHeader(), so every FrameHeader
 * holds a combination of fields the standard allows.
 */
class FrameHeader {
public:
    Version version() const { return version_; }
    Layer layer() const { return layer_; }
    bool hasCrc() const { return has_crc_; }
    uint32_t bitRateBps() const { return bit_rate_bps_; }     // 0 = free format
    uint32_t sampleRateHz() const { return sample_rate_hz_; }
    bool padded() const { return padded_; }
    bool privateBit() const { return private_; }
    ChannelMode channelMode() const { return channel_mode_; }
    const ModeExtension& modeExtension() const { return mode_extension_; }
    bool copyrighted() const { return copyrighted_; }
    bool original() const { return original_; }
    Emphasis emphasis() const { return emphasis_; }

    // Header word in wire (big-endian) order
    uint32_t rawWord() const { return raw_word_; }

    bool isFreeFormat() const { return bit_rate_bps_ == 0; }
    uint32_t samplesPerFrame() const;
    int channelCount() const { return channel_mode_ == ChannelMode::SingleChannel ? 1 : 2; }

    bool operator==(const FrameHeader& other) const;
    bool operator!=(const FrameHeader& other) const { return !(*this == other); }

private:
    friend struct HeaderFields;
    FrameHeader() = default;

    Version version_{Version::Mpeg1};
    Layer layer_{Layer::III};
    bool has_crc_{false};
    uint32_t bit_rate_bps_{0};
    uint32_t sample_rate_hz_{0};
    bool padded_{false};
    bool private_{false};
    ChannelMode channel_mode_{ChannelMode::Stereo};
    ModeExtension mode_extension_;
    bool copyrighted_{false};
    bool original_{false};
    Emphasis emphasis_{Emphasis::None};
    uint32_t raw_word_{0};
};

// Result of decodeHeader(): either a header or the reason there is none
struct HeaderResult {
    std::optional<FrameHeader> header;
    FrameError error{FrameError::None};

    bool ok() const { return header.has_value(); }
    explicit operator bool() const { return ok(); }
};

/**
 * Decode a 4-byte MPEG audio frame header.
 *
 * @param bytes  Pointer to 4 header bytes
 * @param order  Byte order of the window (BigEndian = as found in the stream)
 * @return       Header, or the first rule the word violates
 */
HeaderResult decodeHeader(const uint8_t* bytes, ByteOrder order = ByteOrder::BigEndian);

// Decode a header word already assembled MSB first
HeaderResult decodeHeader(uint32_t word);

// Check for the sync pattern at data[0..1] (caller guarantees 2 bytes)
inline bool isSync(const uint8_t* data) {
    return data[0] == 0xFF && (data[1] & 0xE0) == 0xE0;
}

/**
 * Total frame length in bytes, header inclusive:
 *   samples_per_frame * bitrate / (8 * sample_rate) + padding + crc
 *
 * Free-format headers (bit rate 0) have no defined length; the result is
 * empty and *error (if given) is set to UndefinedFrameLength.
 */
std::optional<uint32_t> frameLengthBytes(const FrameHeader& header, FrameError* error = nullptr);

// Payload bytes following the header and CRC, empty for free format
std::optional<uint32_t> payloadLengthBytes(const FrameHeader& header);

const char* toString(Version version);
const char* toString(Layer layer);
const char* toString(ChannelMode mode);
const char* toString(Emphasis emphasis);

// One-line description, e.g. "MPEG1 Layer III 128kbps 44100Hz mono"
std::string describe(const FrameHeader& header);

/**
 * A confirmed frame: decoded header plus its bytes.
 *
 * The frame keeps one copy of its full bytes (header, CRC, payload);
 * payload() points into that copy.
 */
class Frame {
public:
    Frame(const FrameHeader& header, uint64_t offset, const uint8_t* data, size_t len);

    const FrameHeader& header() const { return header_; }

    // Absolute stream offset of the first header byte
    uint64_t offset() const { return offset_; }

    // Full frame size in bytes
    size_t size() const { return bytes_.size(); }
    const uint8_t* data() const { return bytes_.data(); }

    const uint8_t* payload() const;
    size_t payloadSize() const;

    // CRC word following the header (only when header().hasCrc())
    std::optional<uint16_t> crc() const;

private:
    FrameHeader header_;
    uint64_t offset_;
    std::vector<uint8_t> bytes_;
};

/**
 * Result of a scan: frames in stream order plus byte accounting.
 * consumedBytes() == framedBytes() + skippedBytes().
 */
class ParsedStream {
public:
    const std::vector<Frame>& frames() const { return frames_; }
    size_t frameCount() const { return frame_count_; }

    uint64_t consumedBytes() const { return framed_bytes_ + skipped_bytes_; }
    uint64_t framedBytes() const { return framed_bytes_; }
    uint64_t skippedBytes() const { return skipped_bytes_; }

    // Number of resync steps caused by the given error kind
    size_t errorCount(FrameError error) const;

    uint64_t totalSamples() const { return total_samples_; }
    double durationSeconds() const { return duration_seconds_; }

private:
    friend struct StreamBuilder;

    std::vector<Frame> frames_;
    size_t frame_count_{0};
    uint64_t framed_bytes_{0};
    uint64_t skipped_bytes_{0};
    uint64_t total_samples_{0};
    double duration_seconds_{0.0};
    std::array<size_t, FRAME_ERROR_KIND_COUNT> error_counts_{};
};

// Zero-copy frame callback (data valid only during the call)
using FrameCallback = std::function<void(const FrameHeader& header, uint64_t offset,
                                         const uint8_t* data, size_t len)>;

// Resync notification: cause and stream offset of the rejected candidate
using FrameErrorCallback = std::function<void(FrameError error, uint64_t offset)>;

} // namespace mpaframe
