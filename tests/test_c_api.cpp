/**
 * @file test_c_api.cpp
 * @brief Unit tests for the C wrapper.
 */

#include <catch2/catch.hpp>
#include <mpaframe/mpaframe_c.h>
#include "test_helpers.hpp"
#include <string>

using testutil::HeaderBits;

namespace {

struct CallbackLog {
    int frames = 0;
    uint64_t last_offset = 0;
    size_t last_payload = 0;
};

void countFrame(void *opaque, const mpaframe_frame_t *frame) {
    auto *log = static_cast<CallbackLog*>(opaque);
    log->frames++;
    log->last_offset = frame->offset;
    log->last_payload = frame->payload_size;
}

} // namespace

TEST_CASE("mpaframe_decode_header", "[c_api]") {
    mpaframe_header_t h{};

    SECTION("mono") {
        const uint8_t bytes[] = {0xFF, 0xFB, 0x90, 0xC0};
        REQUIRE(mpaframe_decode_header(bytes, &h) == MPAFRAME_OK);
        REQUIRE(h.version == 1);
        REQUIRE(h.layer == 3);
        REQUIRE(h.has_crc == 0);
        REQUIRE(h.bit_rate_bps == 128000);
        REQUIRE(h.sample_rate_hz == 44100);
        REQUIRE(h.channel_mode == 3);
        REQUIRE(h.ext_kind == MPAFRAME_EXT_NONE);
        REQUIRE(h.samples_per_frame == 1152);
    }

    SECTION("joint stereo") {
        const uint8_t bytes[] = {0xFF, 0xFB, 0xB0, 0x63};
        REQUIRE(mpaframe_decode_header(bytes, &h) == MPAFRAME_OK);
        REQUIRE(h.bit_rate_bps == 192000);
        REQUIRE(h.channel_mode == 1);
        REQUIRE(h.ext_kind == MPAFRAME_EXT_STEREO_FLAGS);
        REQUIRE(h.ms_stereo == 1);
        REQUIRE(h.intensity_stereo == 0);
        REQUIRE(h.emphasis == 3);
    }

    SECTION("MPEG2.5") {
        const uint8_t bytes[] = {0xFF, 0xE3, 0x88, 0xC0};
        REQUIRE(mpaframe_decode_header(bytes, &h) == MPAFRAME_OK);
        REQUIRE(h.version == 25);
        REQUIRE(h.sample_rate_hz == 8000);
        REQUIRE(h.samples_per_frame == 576);
    }
}

TEST_CASE("mpaframe_decode_header errors", "[c_api]") {
    mpaframe_header_t h{};
    h.layer = 42;

    struct Case { uint8_t bytes[4]; int error; };
    const Case cases[] = {
        {{0x00, 0x00, 0x00, 0x00}, MPAFRAME_ERR_SYNC_WORD_MISSING},
        {{0xFF, 0xEB, 0x90, 0xC0}, MPAFRAME_ERR_RESERVED_VERSION},
        {{0xFF, 0xF9, 0x90, 0xC0}, MPAFRAME_ERR_RESERVED_LAYER},
        {{0xFF, 0xFB, 0xF0, 0xC0}, MPAFRAME_ERR_INVALID_BITRATE_INDEX},
        {{0xFF, 0xFB, 0x9C, 0xC0}, MPAFRAME_ERR_RESERVED_SAMPLE_RATE},
        {{0xFF, 0xFB, 0x90, 0xC2}, MPAFRAME_ERR_RESERVED_EMPHASIS},
    };

    for (const auto& c : cases) {
        REQUIRE(mpaframe_decode_header(c.bytes, &h) == c.error);
    }
    REQUIRE(h.layer == 42);

    REQUIRE(mpaframe_decode_header(nullptr, &h) == MPAFRAME_ERR_INVALID_ARG);
    REQUIRE(mpaframe_decode_header(cases[0].bytes, nullptr) == MPAFRAME_ERR_INVALID_ARG);
}

TEST_CASE("mpaframe_frame_length", "[c_api]") {
    uint32_t length = 0;

    const uint8_t mono[] = {0xFF, 0xFB, 0x90, 0xC0};
    REQUIRE(mpaframe_frame_length(mono, &length) == MPAFRAME_OK);
    REQUIRE(length == 417);

    const uint8_t padded[] = {0xFF, 0xFB, 0x92, 0xC0};
    REQUIRE(mpaframe_frame_length(padded, &length) == MPAFRAME_OK);
    REQUIRE(length == 418);

    length = 7;
    const uint8_t free_format[] = {0xFF, 0xFB, 0x00, 0xC0};
    REQUIRE(mpaframe_frame_length(free_format, &length) == MPAFRAME_ERR_UNDEFINED_FRAME_LENGTH);
    REQUIRE(length == 7);

    REQUIRE(mpaframe_frame_length(mono, nullptr) == MPAFRAME_ERR_INVALID_ARG);
}

TEST_CASE("mpaframe_error_string", "[c_api]") {
    REQUIRE(std::string(mpaframe_error_string(MPAFRAME_OK)).size() > 0);
    REQUIRE(std::string(mpaframe_error_string(MPAFRAME_ERR_TRUNCATED_PAYLOAD)) !=
            std::string(mpaframe_error_string(MPAFRAME_ERR_SYNC_WORD_MISSING)));
    REQUIRE(std::string(mpaframe_error_string(MPAFRAME_ERR_INVALID_ARG)) == "Invalid argument");
    REQUIRE(std::string(mpaframe_error_string(99)) == "Unknown error");
}

TEST_CASE("mpaframe_scanner", "[c_api]") {
    HeaderBits bits;
    std::vector<uint8_t> data = {0x12, 0x34};
    for (int i = 0; i < 3; ++i) {
        testutil::append(data, testutil::makeFrame(bits));
    }

    mpaframe_scanner_t *scanner = mpaframe_scanner_create();
    REQUIRE(scanner != nullptr);

    CallbackLog log;
    mpaframe_scanner_set_callback(scanner, countFrame, &log);

    REQUIRE(mpaframe_scanner_feed(scanner, data.data(), data.size()) >= 2);
    REQUIRE(mpaframe_scanner_finish(scanner) == 0);
    REQUIRE(mpaframe_scanner_feed(scanner, data.data(), data.size()) == -1);

    REQUIRE(log.frames == 3);
    REQUIRE(log.last_offset == 2 + 2 * 417);
    REQUIRE(log.last_payload == 413);

    REQUIRE(mpaframe_scanner_frame_count(scanner) == 3);
    REQUIRE(mpaframe_scanner_consumed_bytes(scanner) == data.size());
    REQUIRE(mpaframe_scanner_skipped_bytes(scanner) == 2);

    mpaframe_frame_t frame;
    REQUIRE(mpaframe_scanner_get_frame(scanner, 1, &frame) == 0);
    REQUIRE(frame.offset == 2 + 417);
    REQUIRE(frame.size == 417);
    REQUIRE(frame.data[0] == 0xFF);
    REQUIRE(frame.payload == frame.data + 4);
    REQUIRE(frame.header.bit_rate_bps == 128000);
    REQUIRE(mpaframe_scanner_get_frame(scanner, 3, &frame) == -1);

    mpaframe_scanner_destroy(scanner);
}

TEST_CASE("mpaframe_scanner without retention", "[c_api]") {
    HeaderBits bits;
    bits.protection_bit = false;
    auto data = testutil::makeFrame(bits);
    testutil::append(data, testutil::makeFrame(bits));

    mpaframe_scanner_t *scanner = mpaframe_scanner_create();
    CallbackLog log;
    mpaframe_scanner_set_callback(scanner, countFrame, &log);
    mpaframe_scanner_set_retain(scanner, 0);

    REQUIRE(mpaframe_scanner_feed(scanner, data.data(), data.size()) >= 1);
    REQUIRE(mpaframe_scanner_finish(scanner) == 0);

    REQUIRE(log.frames == 2);
    REQUIRE(log.last_payload == 413);
    REQUIRE(mpaframe_scanner_frame_count(scanner) == 0);

    mpaframe_scanner_destroy(scanner);
}

TEST_CASE("mpaframe_scanner invalid arguments", "[c_api]") {
    const uint8_t byte = 0xFF;
    REQUIRE(mpaframe_scanner_feed(nullptr, &byte, 1) == -1);
    REQUIRE(mpaframe_scanner_finish(nullptr) == -1);
    REQUIRE(mpaframe_scanner_frame_count(nullptr) == 0);
    REQUIRE(mpaframe_scanner_consumed_bytes(nullptr) == 0);

    mpaframe_scanner_t *scanner = mpaframe_scanner_create();
    REQUIRE(mpaframe_scanner_feed(scanner, nullptr, 4) == -1);
    REQUIRE(mpaframe_scanner_feed(scanner, nullptr, 0) == 0);
    REQUIRE(mpaframe_scanner_get_frame(scanner, 0, nullptr) == -1);
    mpaframe_scanner_destroy(scanner);
    mpaframe_scanner_destroy(nullptr);
}
