#pragma once
// MPEG audio header lookup tables (ISO/IEC 11172-3, 13818-3 and the MPEG 2.5 extension)

#include <mpaframe/mpaframe.hpp>
#include <array>
#include <cstdint>

namespace mpaframe {
namespace tables {

// Bitrate columns
enum BitrateColumn {
    MPEG1_L1 = 0,
    MPEG1_L2,
    MPEG1_L3,
    MPEG2_L1,       // MPEG2 and MPEG2.5
    MPEG2_L2_L3,    // MPEG2 and MPEG2.5, Layer II and III share a column
    BITRATE_COLUMNS
};

// Bitrates in kbps, indexed by [bitrate_index][column]
// Index 0 is free format, index 15 is invalid and never looked up
constexpr std::array<std::array<uint16_t, BITRATE_COLUMNS>, 15> BITRATE_KBPS = {{
    //  M1-L1 M1-L2 M1-L3 M2-L1 M2-L2/L3
    {{    0,    0,    0,    0,    0 }},
    {{   32,   32,   32,   32,    8 }},
    {{   64,   48,   40,   48,   16 }},
    {{   96,   56,   48,   56,   24 }},
    {{  128,   64,   56,   64,   32 }},
    {{  160,   80,   64,   80,   40 }},
    {{  192,   96,   80,   96,   48 }},
    {{  224,  112,   96,  112,   56 }},
    {{  256,  128,  112,  128,   64 }},
    {{  288,  160,  128,  144,   80 }},
    {{  320,  192,  160,  160,   96 }},
    {{  352,  224,  192,  176,  112 }},
    {{  384,  256,  224,  192,  128 }},
    {{  416,  320,  256,  224,  144 }},
    {{  448,  384,  320,  256,  160 }}
}};

// Sample rates in Hz, indexed by [sample_rate_index][version]
// Each version halves the rate of the previous one
constexpr std::array<std::array<uint32_t, 3>, 3> SAMPLE_RATE_HZ = {{
    //  MPEG1  MPEG2  MPEG2.5
    {{ 44100, 22050, 11025 }},
    {{ 48000, 24000, 12000 }},
    {{ 32000, 16000,  8000 }}
}};

// Samples per frame, indexed by [layer][version]
constexpr std::array<std::array<uint16_t, 3>, 3> SAMPLES_PER_FRAME = {{
    //  MPEG1 MPEG2 MPEG2.5
    {{   384,  384,  384 }},   // Layer I
    {{  1152, 1152, 1152 }},   // Layer II
    {{  1152,  576,  576 }}    // Layer III
}};

constexpr int versionIndex(Version version) {
    return version == Version::Mpeg1 ? 0 : (version == Version::Mpeg2 ? 1 : 2);
}

constexpr int layerIndex(Layer layer) {
    return layer == Layer::I ? 0 : (layer == Layer::II ? 1 : 2);
}

constexpr BitrateColumn bitrateColumn(Version version, Layer layer) {
    if (version == Version::Mpeg1) {
        return layer == Layer::I ? MPEG1_L1 : (layer == Layer::II ? MPEG1_L2 : MPEG1_L3);
    }
    return layer == Layer::I ? MPEG2_L1 : MPEG2_L2_L3;
}

// Bit rate in bps for a non-reserved index (0..14)
constexpr uint32_t bitrateBps(Version version, Layer layer, uint32_t index) {
    return BITRATE_KBPS[index][bitrateColumn(version, layer)] * 1000u;
}

// Sample rate for a non-reserved index (0..2)
constexpr uint32_t sampleRateHz(Version version, uint32_t index) {
    return SAMPLE_RATE_HZ[index][versionIndex(version)];
}

constexpr uint32_t samplesPerFrame(Version version, Layer layer) {
    return SAMPLES_PER_FRAME[layerIndex(layer)][versionIndex(version)];
}

static_assert(bitrateBps(Version::Mpeg1, Layer::III, 9) == 128000, "MPEG1 L3 index 9");
static_assert(sampleRateHz(Version::Mpeg25, 2) == 8000, "MPEG2.5 index 2");
static_assert(samplesPerFrame(Version::Mpeg2, Layer::III) == 576, "MPEG2 L3 granules");

} // namespace tables
} // namespace mpaframe
