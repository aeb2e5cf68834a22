#include "window.h"

#include <string>

#include "debug.h"
#include "vcdiff_error.h"

namespace vcdelta {

namespace {

constexpr uint8_t kKnownWindowBits = VCD_SOURCE | VCD_TARGET | VCD_ADLER32;
constexpr uint8_t kCompressionBits = VCD_DATACOMP | VCD_INSTCOMP | VCD_ADDRCOMP;

void readSourceSegment(ByteCursor& delta, const WindowLimits& limits,
                       WindowHeader& h) {
    if (h.indicator & VCD_SOURCE) {
        h.sourceKind = SourceKind::Dictionary;
    } else {
        if (!limits.allowTargetSource) {
            throw VcdiffError(ErrorKind::UnsupportedFeature,
                              "VCD_TARGET source segments are disabled");
        }
        h.sourceKind = SourceKind::Target;
    }

    h.sourceLength = readVarint<uint64_t>(delta, "source segment length");
    h.sourcePosition = readVarint<uint64_t>(delta, "source segment position");

    const uint64_t available = h.sourceKind == SourceKind::Dictionary
                                   ? limits.dictionarySize
                                   : limits.decodedSize;
    if (h.sourcePosition > available ||
        h.sourceLength > available - h.sourcePosition) {
        throw VcdiffError(
            ErrorKind::LengthMismatch,
            "source segment [" + std::to_string(h.sourcePosition) + ", +" +
                std::to_string(h.sourceLength) + ") exceeds " +
                (h.sourceKind == SourceKind::Dictionary ? "dictionary"
                                                        : "decoded target") +
                " size " + std::to_string(available));
    }
}

}  // namespace

Window parseWindow(ByteCursor& delta, const WindowLimits& limits) {
    Window w;
    WindowHeader& h = w.header;

    /* ---- window indicator and source segment ---------------------------- */
    h.indicator = delta.readByte("window indicator");
    if (h.indicator & ~kKnownWindowBits) {
        throw VcdiffError(ErrorKind::InvalidIndicator,
                          "reserved window indicator bits set: " +
                              std::to_string(h.indicator));
    }
    if ((h.indicator & VCD_SOURCE) && (h.indicator & VCD_TARGET)) {
        throw VcdiffError(ErrorKind::InvalidIndicator,
                          "window sets both VCD_SOURCE and VCD_TARGET");
    }
    if (h.indicator & (VCD_SOURCE | VCD_TARGET)) {
        readSourceSegment(delta, limits, h);
    }

    /* ---- delta encoding header ------------------------------------------ */
    h.deltaLength = readVarint<uint32_t>(delta, "delta encoding length");
    if (delta.remaining() < h.deltaLength) {
        throw VcdiffError(ErrorKind::TruncatedInput,
                          "delta encoding declares " +
                              std::to_string(h.deltaLength) + " bytes, " +
                              std::to_string(delta.remaining()) + " remain");
    }
    const size_t encodingStart = delta.position();

    h.targetLength = readVarint<uint32_t>(delta, "target window length");
    if (h.targetLength > limits.maxTargetWindowSize) {
        throw VcdiffError(ErrorKind::LimitExceeded,
                          "target window length " +
                              std::to_string(h.targetLength) +
                              " exceeds limit " +
                              std::to_string(limits.maxTargetWindowSize));
    }

    h.deltaIndicator = delta.readByte("delta indicator");
    if (h.deltaIndicator & ~kCompressionBits) {
        throw VcdiffError(ErrorKind::InvalidIndicator,
                          "reserved delta indicator bits set: " +
                              std::to_string(h.deltaIndicator));
    }
    if (h.deltaIndicator & kCompressionBits) {
        throw VcdiffError(ErrorKind::UnsupportedFeature,
                          "secondary compression of window sections");
    }

    h.dataLength = readVarint<uint32_t>(delta, "data section length");
    h.instructionsLength =
        readVarint<uint32_t>(delta, "instructions section length");
    h.addressesLength = readVarint<uint32_t>(delta, "addresses section length");

    if (h.indicator & VCD_ADLER32) {
        h.hasChecksum = true;
        h.checksum = readBigEndian32(delta, "window checksum");
    }

    /* ---- sections ------------------------------------------------------- */
    const uint64_t headerBytes = delta.position() - encodingStart;
    const uint64_t sectionBytes = uint64_t(h.dataLength) +
                                  h.instructionsLength + h.addressesLength;
    if (headerBytes > h.deltaLength ||
        sectionBytes != h.deltaLength - headerBytes) {
        throw VcdiffError(ErrorKind::LengthMismatch,
                          "delta encoding length " +
                              std::to_string(h.deltaLength) +
                              " does not match header " +
                              std::to_string(headerBytes) + " + sections " +
                              std::to_string(sectionBytes));
    }

    w.data = delta.sub(h.dataLength, "data section");
    w.instructions = delta.sub(h.instructionsLength, "instructions section");
    w.addresses = delta.sub(h.addressesLength, "addresses section");

    VCD_TRACE("window indicator=" << unsigned(h.indicator)
              << " source=[" << h.sourcePosition << ", +" << h.sourceLength
              << ") target=" << h.targetLength << " data=" << h.dataLength
              << " inst=" << h.instructionsLength
              << " addr=" << h.addressesLength);
    return w;
}

}  // namespace vcdelta
