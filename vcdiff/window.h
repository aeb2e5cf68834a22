#pragma once

#include <cstdint>

#include "varint.h"

namespace vcdelta {

// Win_Indicator bits.
enum : uint8_t {
    VCD_SOURCE = 0x01,
    VCD_TARGET = 0x02,
    // xdelta3 extension: the checksum is flagged per window, not in the file
    // header, and stored after addresses_length.
    VCD_ADLER32 = 0x04
};

// Delta_Indicator bits (secondary compression of each section).
enum : uint8_t {
    VCD_DATACOMP = 0x01,
    VCD_INSTCOMP = 0x02,
    VCD_ADDRCOMP = 0x04
};

enum class SourceKind { None, Dictionary, Target };

struct WindowHeader {
    uint8_t indicator = 0;
    SourceKind sourceKind = SourceKind::None;
    uint64_t sourceLength = 0;
    uint64_t sourcePosition = 0;
    uint32_t deltaLength = 0;
    uint32_t targetLength = 0;
    uint8_t deltaIndicator = 0;
    uint32_t dataLength = 0;
    uint32_t instructionsLength = 0;
    uint32_t addressesLength = 0;
    bool hasChecksum = false;
    uint32_t checksum = 0;
};

// A parsed window: header plus cursors over its three sections.
struct Window {
    WindowHeader header;
    ByteCursor data;
    ByteCursor instructions;
    ByteCursor addresses;
};

// What the window may legally reference, and how large it may be.
struct WindowLimits {
    uint64_t dictionarySize = 0;
    uint64_t decodedSize = 0;
    uint64_t maxTargetWindowSize = 0;
    bool allowTargetSource = true;
};

/**
 * Parse one window starting at the cursor and advance past it.
 *
 * Throws TruncatedInput when a field or the declared delta encoding runs
 * past the input, LengthMismatch when the declared lengths do not add up or
 * the source segment is out of range, UnsupportedFeature for secondary
 * compression and InvalidIndicator for reserved indicator bits.
 */
Window parseWindow(ByteCursor& delta, const WindowLimits& limits);

}  // namespace vcdelta
