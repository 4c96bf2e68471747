/*
 * libmpaframe C API
 * C wrapper for using libmpaframe from C code
 */
#ifndef MPAFRAME_C_H
#define MPAFRAME_C_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Error codes (same order as mpaframe::FrameError) */
typedef enum {
    MPAFRAME_OK = 0,
    MPAFRAME_ERR_SYNC_WORD_MISSING,
    MPAFRAME_ERR_RESERVED_VERSION,
    MPAFRAME_ERR_RESERVED_LAYER,
    MPAFRAME_ERR_INVALID_BITRATE_INDEX,
    MPAFRAME_ERR_RESERVED_SAMPLE_RATE,
    MPAFRAME_ERR_RESERVED_EMPHASIS,
    MPAFRAME_ERR_PROHIBITED_BITRATE_CHANNEL,
    MPAFRAME_ERR_UNDEFINED_FRAME_LENGTH,
    MPAFRAME_ERR_TRUNCATED_PAYLOAD,
    MPAFRAME_ERR_INVALID_ARG = -1,
    MPAFRAME_ERR_NO_MEMORY = -2
} mpaframe_error_t;

/* Joint stereo extension kind */
typedef enum {
    MPAFRAME_EXT_NONE = 0,      /* Not joint stereo */
    MPAFRAME_EXT_BAND_START,    /* Layer I/II: band_start valid */
    MPAFRAME_EXT_STEREO_FLAGS   /* Layer III: intensity_stereo/ms_stereo valid */
} mpaframe_ext_kind_t;

/* Decoded frame header (C struct) */
typedef struct {
    int version;            /* 1 = MPEG1, 2 = MPEG2, 25 = MPEG2.5 */
    int layer;              /* 1, 2 or 3 */
    int has_crc;            /* 1 if a 16-bit CRC follows the header */
    uint32_t bit_rate_bps;  /* 0 = free format */
    uint32_t sample_rate_hz;
    int padded;
    int private_bit;
    int channel_mode;       /* 0=stereo, 1=joint, 2=dual, 3=mono */
    mpaframe_ext_kind_t ext_kind;
    int band_start;         /* 4, 8, 12 or 16 */
    int intensity_stereo;
    int ms_stereo;
    int copyrighted;
    int original;
    int emphasis;           /* 0=none, 1=50/15 ms, 3=CCIT J.17 */
    uint32_t samples_per_frame;
} mpaframe_header_t;

/* Frame view (pointers owned by the scanner) */
typedef struct {
    mpaframe_header_t header;
    uint64_t offset;        /* Stream offset of the header */
    const uint8_t *data;    /* Full frame */
    size_t size;
    const uint8_t *payload; /* After header and CRC */
    size_t payload_size;
} mpaframe_frame_t;

/* Opaque scanner handle */
typedef struct mpaframe_scanner mpaframe_scanner_t;

/* Callback for confirmed frames (frame valid only during the call) */
typedef void (*mpaframe_frame_cb)(void *opaque, const mpaframe_frame_t *frame);

/**
 * Get a description of an error code.
 * @param error Error code
 * @return      Static string
 */
const char *mpaframe_error_string(int error);

/**
 * Decode a 4-byte frame header (stream byte order).
 * @param bytes  4 header bytes
 * @param out    Decoded header (untouched on error)
 * @return       MPAFRAME_OK or the decode error
 */
int mpaframe_decode_header(const uint8_t *bytes, mpaframe_header_t *out);

/**
 * Compute the frame length of a header.
 * @param bytes  4 header bytes
 * @param length Output: frame length in bytes, header inclusive
 * @return       MPAFRAME_OK, a decode error, or MPAFRAME_ERR_UNDEFINED_FRAME_LENGTH
 */
int mpaframe_frame_length(const uint8_t *bytes, uint32_t *length);

/**
 * Create a new frame scanner.
 * @return Scanner handle, or NULL on error
 */
mpaframe_scanner_t *mpaframe_scanner_create(void);

/**
 * Destroy a scanner.
 * @param scanner Scanner handle
 */
void mpaframe_scanner_destroy(mpaframe_scanner_t *scanner);

/**
 * Set frame callback.
 * @param scanner  Scanner handle
 * @param callback Function to call for each frame (NULL to disable)
 * @param opaque   User data passed to callback
 */
void mpaframe_scanner_set_callback(mpaframe_scanner_t *scanner,
                                   mpaframe_frame_cb callback, void *opaque);

/**
 * Keep frames for mpaframe_scanner_get_frame() (default: 1).
 * @param scanner Scanner handle
 * @param retain  0 = callback only
 */
void mpaframe_scanner_set_retain(mpaframe_scanner_t *scanner, int retain);

/**
 * Feed stream data.
 * @param scanner Scanner handle
 * @param data    Stream bytes
 * @param len     Length in bytes
 * @return        Number of frames confirmed, or -1 on error
 */
int mpaframe_scanner_feed(mpaframe_scanner_t *scanner, const uint8_t *data, size_t len);

/**
 * Signal end of input. Frames become available through get_frame.
 * @param scanner Scanner handle
 * @return        0 on success, -1 on error
 */
int mpaframe_scanner_finish(mpaframe_scanner_t *scanner);

/**
 * Get number of retained frames (after finish).
 * @param scanner Scanner handle
 * @return        Frame count
 */
size_t mpaframe_scanner_frame_count(mpaframe_scanner_t *scanner);

/**
 * Get a retained frame (after finish).
 * @param scanner Scanner handle
 * @param index   Frame index
 * @param out     Frame view, valid until the scanner is destroyed
 * @return        0 on success, -1 if index is out of range
 */
int mpaframe_scanner_get_frame(mpaframe_scanner_t *scanner, size_t index,
                               mpaframe_frame_t *out);

/**
 * Get total consumed bytes (framed + skipped).
 * @param scanner Scanner handle
 * @return        Byte count
 */
uint64_t mpaframe_scanner_consumed_bytes(mpaframe_scanner_t *scanner);

/**
 * Get number of bytes skipped while resynchronizing.
 * @param scanner Scanner handle
 * @return        Byte count
 */
uint64_t mpaframe_scanner_skipped_bytes(mpaframe_scanner_t *scanner);

#ifdef __cplusplus
}
#endif

#endif /* MPAFRAME_C_H */
