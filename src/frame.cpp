// Frame length calculation and frame/stream value types

#include <mpaframe/mpaframe.hpp>
#include "stream_builder.hpp"
#include "tables.hpp"
#include <sstream>

namespace mpaframe {

const char* errorString(FrameError error) {
    switch (error) {
        case FrameError::None:                      return "OK";
        case FrameError::SyncWordMissing:           return "Sync word missing";
        case FrameError::ReservedVersion:           return "Reserved MPEG version";
        case FrameError::ReservedLayer:             return "Reserved layer";
        case FrameError::InvalidBitrateIndex:       return "Invalid bitrate index";
        case FrameError::ReservedSampleRate:        return "Reserved sample rate";
        case FrameError::ReservedEmphasis:          return "Reserved emphasis";
        case FrameError::ProhibitedBitrateChannelCombination:
            return "Prohibited bitrate/channel mode combination";
        case FrameError::UndefinedFrameLength:      return "Undefined frame length (free format)";
        case FrameError::TruncatedPayload:          return "Truncated payload";
    }
    return "Unknown error";
}

const char* toString(Version version) {
    switch (version) {
        case Version::Mpeg1:  return "MPEG1";
        case Version::Mpeg2:  return "MPEG2";
        case Version::Mpeg25: return "MPEG2.5";
    }
    return "?";
}

const char* toString(Layer layer) {
    switch (layer) {
        case Layer::I:   return "Layer I";
        case Layer::II:  return "Layer II";
        case Layer::III: return "Layer III";
    }
    return "?";
}

const char* toString(ChannelMode mode) {
    switch (mode) {
        case ChannelMode::Stereo:        return "stereo";
        case ChannelMode::JointStereo:   return "joint stereo";
        case ChannelMode::DualChannel:   return "dual channel";
        case ChannelMode::SingleChannel: return "mono";
    }
    return "?";
}

const char* toString(Emphasis emphasis) {
    switch (emphasis) {
        case Emphasis::None:    return "none";
        case Emphasis::Ms5015:  return "50/15 ms";
        case Emphasis::CcitJ17: return "CCIT J.17";
    }
    return "?";
}

std::string describe(const FrameHeader& header) {
    std::ostringstream out;
    out << toString(header.version()) << " " << toString(header.layer()) << " ";
    if (header.isFreeFormat()) {
        out << "free";
    } else {
        out << header.bitRateBps() / 1000 << "kbps";
    }
    out << " " << header.sampleRateHz() << "Hz " << toString(header.channelMode());
    if (header.hasCrc()) {
        out << " crc";
    }
    return out.str();
}

uint32_t FrameHeader::samplesPerFrame() const {
    return tables::samplesPerFrame(version_, layer_);
}

bool FrameHeader::operator==(const FrameHeader& other) const {
    return version_ == other.version_
        && layer_ == other.layer_
        && has_crc_ == other.has_crc_
        && bit_rate_bps_ == other.bit_rate_bps_
        && sample_rate_hz_ == other.sample_rate_hz_
        && padded_ == other.padded_
        && private_ == other.private_
        && channel_mode_ == other.channel_mode_
        && mode_extension_ == other.mode_extension_
        && copyrighted_ == other.copyrighted_
        && original_ == other.original_
        && emphasis_ == other.emphasis_;
}

std::optional<uint32_t> frameLengthBytes(const FrameHeader& header, FrameError* error) {
    if (header.isFreeFormat()) {
        if (error) {
            *error = FrameError::UndefinedFrameLength;
        }
        return std::nullopt;
    }

    // 64-bit intermediate: 1152 * 448000 overflows 32 bits
    uint64_t slots = static_cast<uint64_t>(header.samplesPerFrame()) * header.bitRateBps()
                   / (8ull * header.sampleRateHz());
    uint32_t length = static_cast<uint32_t>(slots);
    if (header.padded()) length += 1;
    if (header.hasCrc()) length += CRC_SIZE;

    if (error) {
        *error = FrameError::None;
    }
    return length;
}

std::optional<uint32_t> payloadLengthBytes(const FrameHeader& header) {
    auto length = frameLengthBytes(header);
    if (!length) {
        return std::nullopt;
    }
    uint32_t overhead = HEADER_SIZE + (header.hasCrc() ? CRC_SIZE : 0);
    return *length > overhead ? *length - overhead : 0;
}

Frame::Frame(const FrameHeader& header, uint64_t offset, const uint8_t* data, size_t len)
    : header_(header)
    , offset_(offset)
    , bytes_(data, data + len)
{
}

const uint8_t* Frame::payload() const {
    size_t start = HEADER_SIZE + (header_.hasCrc() ? CRC_SIZE : 0);
    return start < bytes_.size() ? bytes_.data() + start : bytes_.data() + bytes_.size();
}

size_t Frame::payloadSize() const {
    size_t start = HEADER_SIZE + (header_.hasCrc() ? CRC_SIZE : 0);
    return start < bytes_.size() ? bytes_.size() - start : 0;
}

std::optional<uint16_t> Frame::crc() const {
    if (!header_.hasCrc() || bytes_.size() < HEADER_SIZE + CRC_SIZE) {
        return std::nullopt;
    }
    return static_cast<uint16_t>((bytes_[4] << 8) | bytes_[5]);
}

size_t ParsedStream::errorCount(FrameError error) const {
    size_t index = static_cast<size_t>(error);
    return index < error_counts_.size() ? error_counts_[index] : 0;
}

void StreamBuilder::addFrame(ParsedStream& stream, const FrameHeader& header, uint64_t offset,
                             const uint8_t* data, size_t len, bool retain) {
    if (retain) {
        stream.frames_.emplace_back(header, offset, data, len);
    }
    stream.frame_count_++;
    stream.framed_bytes_ += len;
    stream.total_samples_ += header.samplesPerFrame();
    stream.duration_seconds_ += static_cast<double>(header.samplesPerFrame()) / header.sampleRateHz();
}

void StreamBuilder::addSkipped(ParsedStream& stream, uint64_t count) {
    stream.skipped_bytes_ += count;
}

void StreamBuilder::addError(ParsedStream& stream, FrameError error) {
    size_t index = static_cast<size_t>(error);
    if (index < stream.error_counts_.size()) {
        stream.error_counts_[index]++;
    }
}

} // namespace mpaframe
