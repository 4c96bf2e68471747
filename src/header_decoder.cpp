// MPEG audio frame header decoder
//
// Header layout (32 bits, MSB first):
//   AAAAAAAA AAABBCCD EEEEFFGH IIJJKLMM
//   A: sync (11 bits set)      B: version        C: layer        D: protection (0 = CRC)
//   E: bitrate index           F: sample rate    G: padding      H: private
//   I: channel mode            J: mode extension K: copyright    L: original
//   M: emphasis

#include <mpaframe/mpaframe.hpp>
#include "tables.hpp"

namespace mpaframe {

namespace {

// Raw field values
constexpr uint32_t VERSION_25 = 0;
constexpr uint32_t VERSION_RESERVED = 1;
constexpr uint32_t VERSION_2 = 2;
constexpr uint32_t VERSION_1 = 3;

constexpr uint32_t LAYER_RESERVED = 0;
constexpr uint32_t LAYER_3 = 1;
constexpr uint32_t LAYER_2 = 2;
constexpr uint32_t LAYER_1 = 3;

constexpr uint32_t BITRATE_INDEX_INVALID = 0x0F;
constexpr uint32_t SAMPLE_RATE_RESERVED = 3;
constexpr uint32_t EMPHASIS_RESERVED = 2;

inline uint32_t field(uint32_t word, int shift, uint32_t mask) {
    return (word >> shift) & mask;
}

inline bool bit(uint32_t word, int shift) {
    return ((word >> shift) & 1) != 0;
}

HeaderResult failure(FrameError error) {
    HeaderResult result;
    result.error = error;
    return result;
}

// Layer II allows only some bitrate/mode combinations (ISO/IEC 11172-3, 2.4.2.3)
// Free format (0) passes
bool layer2Allowed(uint32_t bit_rate_bps, ChannelMode mode) {
    uint32_t kbps = bit_rate_bps / 1000;
    if (mode == ChannelMode::SingleChannel) {
        return kbps != 224 && kbps != 256 && kbps != 320 && kbps != 384;
    }
    return kbps != 32 && kbps != 48 && kbps != 56 && kbps != 80;
}

} // namespace

// Builds FrameHeader values field by field; the only writer of FrameHeader
struct HeaderFields {
    static HeaderResult decode(uint32_t word);
};

HeaderResult HeaderFields::decode(uint32_t word) {
    if ((word & SYNC_MASK) != SYNC_MASK) {
        return failure(FrameError::SyncWordMissing);
    }

    FrameHeader h;
    h.raw_word_ = word;

    switch (field(word, 19, 0x3)) {
        case VERSION_1:  h.version_ = Version::Mpeg1; break;
        case VERSION_2:  h.version_ = Version::Mpeg2; break;
        case VERSION_25: h.version_ = Version::Mpeg25; break;
        case VERSION_RESERVED:
        default:
            return failure(FrameError::ReservedVersion);
    }

    switch (field(word, 17, 0x3)) {
        case LAYER_1: h.layer_ = Layer::I; break;
        case LAYER_2: h.layer_ = Layer::II; break;
        case LAYER_3: h.layer_ = Layer::III; break;
        case LAYER_RESERVED:
        default:
            return failure(FrameError::ReservedLayer);
    }

    // Protection bit is inverted: 0 means a CRC follows
    h.has_crc_ = !bit(word, 16);

    uint32_t bitrate_index = field(word, 12, 0xF);
    if (bitrate_index == BITRATE_INDEX_INVALID) {
        return failure(FrameError::InvalidBitrateIndex);
    }
    h.bit_rate_bps_ = tables::bitrateBps(h.version_, h.layer_, bitrate_index);

    uint32_t sample_rate_index = field(word, 10, 0x3);
    if (sample_rate_index == SAMPLE_RATE_RESERVED) {
        return failure(FrameError::ReservedSampleRate);
    }
    h.sample_rate_hz_ = tables::sampleRateHz(h.version_, sample_rate_index);

    h.padded_ = bit(word, 9);
    h.private_ = bit(word, 8);

    switch (field(word, 6, 0x3)) {
        case 0: h.channel_mode_ = ChannelMode::Stereo; break;
        case 1: h.channel_mode_ = ChannelMode::JointStereo; break;
        case 2: h.channel_mode_ = ChannelMode::DualChannel; break;
        default: h.channel_mode_ = ChannelMode::SingleChannel; break;
    }

    // Mode extension is meaningless outside joint stereo
    uint32_t mode_ext = field(word, 4, 0x3);
    if (h.channel_mode_ == ChannelMode::JointStereo) {
        switch (h.layer_) {
            case Layer::I:
            case Layer::II:
                h.mode_extension_ = BandStart{static_cast<uint8_t>(4 + 4 * mode_ext)};
                break;
            case Layer::III:
                h.mode_extension_ = StereoFlags{(mode_ext & 0x1) != 0, (mode_ext & 0x2) != 0};
                break;
        }
    }

    h.copyrighted_ = bit(word, 3);
    h.original_ = bit(word, 2);

    switch (field(word, 0, 0x3)) {
        case 0: h.emphasis_ = Emphasis::None; break;
        case 1: h.emphasis_ = Emphasis::Ms5015; break;
        case 3: h.emphasis_ = Emphasis::CcitJ17; break;
        case EMPHASIS_RESERVED:
        default:
            return failure(FrameError::ReservedEmphasis);
    }

    // Checked on the decoded rate, for every version
    if (h.layer_ == Layer::II && !layer2Allowed(h.bit_rate_bps_, h.channel_mode_)) {
        return failure(FrameError::ProhibitedBitrateChannelCombination);
    }

    HeaderResult result;
    result.header = h;
    return result;
}

HeaderResult decodeHeader(uint32_t word) {
    return HeaderFields::decode(word);
}

HeaderResult decodeHeader(const uint8_t* bytes, ByteOrder order) {
    uint32_t word;
    if (order == ByteOrder::BigEndian) {
        word = (static_cast<uint32_t>(bytes[0]) << 24)
             | (static_cast<uint32_t>(bytes[1]) << 16)
             | (static_cast<uint32_t>(bytes[2]) << 8)
             | bytes[3];
    } else {
        word = (static_cast<uint32_t>(bytes[3]) << 24)
             | (static_cast<uint32_t>(bytes[2]) << 16)
             | (static_cast<uint32_t>(bytes[1]) << 8)
             | bytes[0];
    }
    return HeaderFields::decode(word);
}

} // namespace mpaframe
