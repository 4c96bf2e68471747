/**
 * @file test_helpers.hpp
 * @brief Synthetic MPEG audio header and frame builders for tests.
 */

#pragma once

#include <mpaframe/mpaframe.hpp>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace testutil {

// Raw header fields; defaults give MPEG1 Layer III 128 kbps 44.1 kHz mono
struct HeaderBits {
    uint32_t version = 3;           // 00 2.5, 01 reserved, 10 MPEG2, 11 MPEG1
    uint32_t layer = 1;             // 00 reserved, 01 III, 10 II, 11 I
    bool protection_bit = true;     // true = no CRC
    uint32_t bitrate_index = 9;
    uint32_t sample_rate_index = 0;
    bool padding = false;
    bool private_bit = false;
    uint32_t mode = 3;
    uint32_t mode_ext = 0;
    bool copyright = false;
    bool original = false;
    uint32_t emphasis = 0;

    uint32_t word() const {
        return 0xFFE00000u
             | (version << 19)
             | (layer << 17)
             | (static_cast<uint32_t>(protection_bit) << 16)
             | (bitrate_index << 12)
             | (sample_rate_index << 10)
             | (static_cast<uint32_t>(padding) << 9)
             | (static_cast<uint32_t>(private_bit) << 8)
             | (mode << 6)
             | (mode_ext << 4)
             | (static_cast<uint32_t>(copyright) << 3)
             | (static_cast<uint32_t>(original) << 2)
             | emphasis;
    }

    std::array<uint8_t, 4> bytes() const {
        uint32_t w = word();
        return {{static_cast<uint8_t>(w >> 24), static_cast<uint8_t>(w >> 16),
                 static_cast<uint8_t>(w >> 8), static_cast<uint8_t>(w)}};
    }
};

// Payload filler that never forms a sync word
inline uint8_t fill(size_t i) {
    return static_cast<uint8_t>((i * 7 + 3) & 0x7F);
}

// Complete frame with a sync-free payload
inline std::vector<uint8_t> makeFrame(const HeaderBits& bits, uint16_t crc = 0xABCD) {
    auto result = mpaframe::decodeHeader(bits.word());
    if (!result) {
        throw std::invalid_argument(mpaframe::errorString(result.error));
    }
    auto length = mpaframe::frameLengthBytes(*result.header);
    if (!length) {
        throw std::invalid_argument("free format frame has no length");
    }

    std::vector<uint8_t> frame;
    auto header = bits.bytes();
    frame.insert(frame.end(), header.begin(), header.end());
    if (!bits.protection_bit) {
        frame.push_back(static_cast<uint8_t>(crc >> 8));
        frame.push_back(static_cast<uint8_t>(crc & 0xFF));
    }
    while (frame.size() < *length) {
        frame.push_back(fill(frame.size()));
    }
    return frame;
}

inline void append(std::vector<uint8_t>& out, const std::vector<uint8_t>& data) {
    out.insert(out.end(), data.begin(), data.end());
}

inline mpaframe::FrameHeader header(const HeaderBits& bits) {
    return *mpaframe::decodeHeader(bits.word()).header;
}

} // namespace testutil
