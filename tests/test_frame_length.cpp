/**
 * @file test_frame_length.cpp
 * @brief Unit tests for frame length calculation.
 */

#include <catch2/catch.hpp>
#include <mpaframe/mpaframe.hpp>
#include "test_helpers.hpp"

using namespace mpaframe;
using testutil::HeaderBits;

TEST_CASE("frameLengthBytes MPEG1 Layer III 128 kbps", "[frame_length]") {
    HeaderBits bits;

    SECTION("unpadded") {
        auto length = frameLengthBytes(testutil::header(bits));
        REQUIRE(length.has_value());
        REQUIRE(*length == 417);
    }

    SECTION("padded") {
        bits.padding = true;
        REQUIRE(frameLengthBytes(testutil::header(bits)) == 418u);
    }

    SECTION("with CRC") {
        bits.protection_bit = false;
        REQUIRE(frameLengthBytes(testutil::header(bits)) == 419u);
        REQUIRE(payloadLengthBytes(testutil::header(bits)) == 413u);
    }

    SECTION("payload length") {
        REQUIRE(payloadLengthBytes(testutil::header(bits)) == 413u);
    }
}

TEST_CASE("frameLengthBytes FF FB B0 63", "[frame_length]") {
    const uint8_t bytes[] = {0xFF, 0xFB, 0xB0, 0x63};
    auto result = decodeHeader(bytes);
    REQUIRE(result.ok());
    REQUIRE(frameLengthBytes(*result.header) == 626u);   // 1152 * 192000 / (8 * 44100)
}

TEST_CASE("frameLengthBytes per layer and version", "[frame_length]") {
    HeaderBits bits;
    bits.mode = 0;

    SECTION("Layer I 384 kbps 48 kHz") {
        bits.layer = 3;
        bits.bitrate_index = 12;
        bits.sample_rate_index = 1;
        REQUIRE(frameLengthBytes(testutil::header(bits)) == 384u);

        bits.padding = true;
        bits.protection_bit = false;
        REQUIRE(frameLengthBytes(testutil::header(bits)) == 387u);
    }

    SECTION("Layer II 192 kbps 48 kHz") {
        bits.layer = 2;
        bits.bitrate_index = 10;
        bits.sample_rate_index = 1;
        REQUIRE(frameLengthBytes(testutil::header(bits)) == 576u);
    }

    SECTION("MPEG2 Layer III 64 kbps 22.05 kHz") {
        bits.version = 2;
        bits.bitrate_index = 8;
        REQUIRE(frameLengthBytes(testutil::header(bits)) == 208u);  // 576 * 64000 / 176400
    }

    SECTION("MPEG2.5 Layer III 8 kbps 8 kHz") {
        bits.version = 0;
        bits.bitrate_index = 1;
        bits.sample_rate_index = 2;
        REQUIRE(frameLengthBytes(testutil::header(bits)) == 72u);
    }

    SECTION("largest frame does not overflow") {
        bits.layer = 3;
        bits.bitrate_index = 14;        // 448 kbps
        bits.sample_rate_index = 2;     // 32 kHz
        REQUIRE(frameLengthBytes(testutil::header(bits)) == 672u);

        bits.layer = 2;                 // 1152 samples
        bits.bitrate_index = 14;        // 384 kbps
        REQUIRE(frameLengthBytes(testutil::header(bits)) == 1728u);
    }
}

TEST_CASE("frameLengthBytes free format", "[frame_length]") {
    HeaderBits bits;
    bits.bitrate_index = 0;

    for (uint32_t version : {3u, 2u, 0u}) {
        for (uint32_t layer : {1u, 2u, 3u}) {
            bits.version = version;
            bits.layer = layer;
            FrameHeader h = testutil::header(bits);
            REQUIRE(h.bitRateBps() == 0);

            FrameError error = FrameError::None;
            auto length = frameLengthBytes(h, &error);
            REQUIRE_FALSE(length.has_value());
            REQUIRE(error == FrameError::UndefinedFrameLength);
            REQUIRE_FALSE(payloadLengthBytes(h).has_value());
        }
    }
}

TEST_CASE("frameLengthBytes clears error on success", "[frame_length]") {
    HeaderBits bits;
    FrameError error = FrameError::UndefinedFrameLength;
    REQUIRE(frameLengthBytes(testutil::header(bits), &error).has_value());
    REQUIRE(error == FrameError::None);
}

TEST_CASE("frameLengthBytes is monotonic in bit rate", "[frame_length]") {
    HeaderBits bits;
    bits.mode = 0;

    for (uint32_t version : {3u, 2u, 0u}) {
        for (uint32_t layer : {1u, 2u, 3u}) {
            for (uint32_t sr : {0u, 1u, 2u}) {
                bits.version = version;
                bits.layer = layer;
                bits.sample_rate_index = sr;

                uint32_t previous_rate = 0;
                uint32_t previous_length = 0;
                for (uint32_t index = 1; index < 15; ++index) {
                    bits.bitrate_index = index;
                    auto result = decodeHeader(bits.word());
                    if (!result) {
                        // Layer II stereo restrictions
                        REQUIRE(result.error == FrameError::ProhibitedBitrateChannelCombination);
                        continue;
                    }
                    auto length = frameLengthBytes(*result.header);
                    REQUIRE(length.has_value());
                    REQUIRE(result.header->bitRateBps() > previous_rate);
                    REQUIRE(*length >= previous_length);
                    previous_rate = result.header->bitRateBps();
                    previous_length = *length;
                }
            }
        }
    }
}

TEST_CASE("samplesPerFrame", "[frame_length]") {
    HeaderBits bits;
    bits.mode = 0;
    bits.bitrate_index = 10;

    struct Case { uint32_t version; uint32_t layer; uint32_t samples; };
    const Case cases[] = {
        {3, 3, 384}, {2, 3, 384}, {0, 3, 384},
        {3, 2, 1152}, {2, 2, 1152}, {0, 2, 1152},
        {3, 1, 1152}, {2, 1, 576}, {0, 1, 576},
    };

    for (const auto& c : cases) {
        bits.version = c.version;
        bits.layer = c.layer;
        REQUIRE(testutil::header(bits).samplesPerFrame() == c.samples);
    }
}
