/*
 * libmpaframe C API implementation
 */
#include <mpaframe/mpaframe_c.h>
#include <mpaframe/frame_scanner.hpp>
#include "logging.h"
#include <new>

using namespace mpaframe;

struct mpaframe_scanner {
    FrameScanner scanner;
    ParsedStream result;
    bool finished{false};

    mpaframe_frame_cb callback{nullptr};
    void *opaque{nullptr};
};

namespace {

void fillHeader(const FrameHeader& h, mpaframe_header_t *out)
{
    switch (h.version()) {
        case Version::Mpeg1:  out->version = 1; break;
        case Version::Mpeg2:  out->version = 2; break;
        case Version::Mpeg25: out->version = 25; break;
    }
    switch (h.layer()) {
        case Layer::I:   out->layer = 1; break;
        case Layer::II:  out->layer = 2; break;
        case Layer::III: out->layer = 3; break;
    }
    out->has_crc = h.hasCrc() ? 1 : 0;
    out->bit_rate_bps = h.bitRateBps();
    out->sample_rate_hz = h.sampleRateHz();
    out->padded = h.padded() ? 1 : 0;
    out->private_bit = h.privateBit() ? 1 : 0;
    out->channel_mode = static_cast<int>(h.channelMode());

    out->ext_kind = MPAFRAME_EXT_NONE;
    out->band_start = 0;
    out->intensity_stereo = 0;
    out->ms_stereo = 0;
    if (auto band = std::get_if<BandStart>(&h.modeExtension())) {
        out->ext_kind = MPAFRAME_EXT_BAND_START;
        out->band_start = band->band;
    } else if (auto flags = std::get_if<StereoFlags>(&h.modeExtension())) {
        out->ext_kind = MPAFRAME_EXT_STEREO_FLAGS;
        out->intensity_stereo = flags->intensity_stereo ? 1 : 0;
        out->ms_stereo = flags->ms_stereo ? 1 : 0;
    }

    out->copyrighted = h.copyrighted() ? 1 : 0;
    out->original = h.original() ? 1 : 0;
    switch (h.emphasis()) {
        case Emphasis::None:    out->emphasis = 0; break;
        case Emphasis::Ms5015:  out->emphasis = 1; break;
        case Emphasis::CcitJ17: out->emphasis = 3; break;
    }
    out->samples_per_frame = h.samplesPerFrame();
}

void fillFrame(const FrameHeader& h, uint64_t offset, const uint8_t *data, size_t len,
               mpaframe_frame_t *out)
{
    fillHeader(h, &out->header);
    out->offset = offset;
    out->data = data;
    out->size = len;
    size_t start = HEADER_SIZE + (h.hasCrc() ? CRC_SIZE : 0);
    out->payload = start < len ? data + start : data + len;
    out->payload_size = start < len ? len - start : 0;
}

} // namespace

extern "C" {

const char *mpaframe_error_string(int error)
{
    switch (error) {
        case MPAFRAME_ERR_INVALID_ARG: return "Invalid argument";
        case MPAFRAME_ERR_NO_MEMORY:   return "Out of memory";
        default:
            break;
    }
    if (error < 0 || error >= static_cast<int>(FRAME_ERROR_KIND_COUNT)) {
        return "Unknown error";
    }
    return errorString(static_cast<FrameError>(error));
}

int mpaframe_decode_header(const uint8_t *bytes, mpaframe_header_t *out)
{
    if (!bytes || !out) {
        return MPAFRAME_ERR_INVALID_ARG;
    }
    HeaderResult result = decodeHeader(bytes);
    if (!result) {
        return static_cast<int>(result.error);
    }
    fillHeader(*result.header, out);
    return MPAFRAME_OK;
}

int mpaframe_frame_length(const uint8_t *bytes, uint32_t *length)
{
    if (!bytes || !length) {
        return MPAFRAME_ERR_INVALID_ARG;
    }
    HeaderResult result = decodeHeader(bytes);
    if (!result) {
        return static_cast<int>(result.error);
    }
    FrameError error = FrameError::None;
    auto len = frameLengthBytes(*result.header, &error);
    if (!len) {
        return static_cast<int>(error);
    }
    *length = *len;
    return MPAFRAME_OK;
}

mpaframe_scanner_t *mpaframe_scanner_create(void)
{
    try {
        return new mpaframe_scanner();
    } catch (const std::bad_alloc&) {
        LOG_ERROR(CAPI, "mpaframe_scanner_create: out of memory");
        return nullptr;
    }
}

void mpaframe_scanner_destroy(mpaframe_scanner_t *scanner)
{
    delete scanner;
}

void mpaframe_scanner_set_callback(mpaframe_scanner_t *scanner,
                                   mpaframe_frame_cb callback, void *opaque)
{
    if (!scanner) return;

    scanner->callback = callback;
    scanner->opaque = opaque;

    if (!callback) {
        scanner->scanner.setFrameCallback(nullptr);
        return;
    }
    scanner->scanner.setFrameCallback(
        [scanner](const FrameHeader& h, uint64_t offset, const uint8_t *data, size_t len) {
            mpaframe_frame_t frame;
            fillFrame(h, offset, data, len, &frame);
            scanner->callback(scanner->opaque, &frame);
        });
}

void mpaframe_scanner_set_retain(mpaframe_scanner_t *scanner, int retain)
{
    if (scanner) {
        scanner->scanner.setRetainFrames(retain != 0);
    }
}

int mpaframe_scanner_feed(mpaframe_scanner_t *scanner, const uint8_t *data, size_t len)
{
    if (!scanner || scanner->finished || (!data && len > 0)) {
        return -1;
    }
    try {
        return static_cast<int>(scanner->scanner.feed(data, len));
    } catch (const std::bad_alloc&) {
        LOG_ERROR(CAPI, "mpaframe_scanner_feed: out of memory");
        return -1;
    }
}

int mpaframe_scanner_finish(mpaframe_scanner_t *scanner)
{
    if (!scanner) return -1;
    if (scanner->finished) return 0;
    try {
        scanner->result = scanner->scanner.finish();
    } catch (const std::bad_alloc&) {
        LOG_ERROR(CAPI, "mpaframe_scanner_finish: out of memory");
        return -1;
    }
    scanner->finished = true;
    return 0;
}

size_t mpaframe_scanner_frame_count(mpaframe_scanner_t *scanner)
{
    if (!scanner) return 0;
    return scanner->result.frames().size();
}

int mpaframe_scanner_get_frame(mpaframe_scanner_t *scanner, size_t index,
                               mpaframe_frame_t *out)
{
    if (!scanner || !out || index >= scanner->result.frames().size()) {
        return -1;
    }
    const Frame& frame = scanner->result.frames()[index];
    fillFrame(frame.header(), frame.offset(), frame.data(), frame.size(), out);
    return 0;
}

uint64_t mpaframe_scanner_consumed_bytes(mpaframe_scanner_t *scanner)
{
    if (!scanner) return 0;
    return scanner->scanner.getConsumedBytes();
}

uint64_t mpaframe_scanner_skipped_bytes(mpaframe_scanner_t *scanner)
{
    if (!scanner) return 0;
    return scanner->scanner.getSkippedBytes();
}

} // extern "C"
