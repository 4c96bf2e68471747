#pragma once

#include <mpaframe/mpaframe.hpp>

namespace mpaframe {

// Write access to ParsedStream for the scanner
struct StreamBuilder {
    static void addFrame(ParsedStream& stream, const FrameHeader& header, uint64_t offset,
                         const uint8_t* data, size_t len, bool retain);
    static void addSkipped(ParsedStream& stream, uint64_t count);
    static void addError(ParsedStream& stream, FrameError error);
};

} // namespace mpaframe
